//! # Class File Reader
//!
//! ## Reading Process
//!
//! ```text
//! 1. magic, version
//! 2. read_constant_pool()     - Long and Double entries take two slots
//! 3. access flags, this/super class, interfaces
//! 4. read_member() x fields, read_member() x methods
//! 5. read_class_attributes()  - InnerClasses is kept, the rest skipped
//! ```
//!
//! All multi-byte values are big-endian. Out-of-range reads and bad
//! constant pool references set the error and make every later read a
//! no-op returning zero.

#include "tplid/loader/class_file.hpp"

#include <fstream>
#include <iterator>

namespace tplid::loader {

// ============================================================================
// ClassFile
// ============================================================================

auto ClassFile::package_path() const -> PackagePath {
    size_t slash = this_class.rfind('/');
    if (slash == std::string::npos) {
        return {};
    }
    return split_path(std::string_view(this_class).substr(0, slash));
}

auto ClassFile::simple_name() const -> std::string {
    size_t slash = this_class.rfind('/');
    return slash == std::string::npos ? this_class : this_class.substr(slash + 1);
}

auto ClassFile::effective_access_flags() const -> uint16_t {
    for (const auto& entry : inner_classes) {
        if (entry.inner_class == this_class) {
            return entry.access_flags;
        }
    }
    return access_flags;
}

bool ClassFile::is_inner() const {
    for (const auto& entry : inner_classes) {
        if (entry.inner_class == this_class) {
            return true;
        }
    }
    return simple_name().find('$') != std::string::npos;
}

auto ClassFile::kind() const -> model::ClassKind {
    uint16_t flags = effective_access_flags() | access_flags;
    return model::classify_class(simple_name(), (flags & access::INTERFACE) != 0,
                                 (flags & access::ENUM) != 0, (flags & access::SYNTHETIC) != 0);
}

bool ClassFile::is_metadata() const {
    if ((access_flags & access::MODULE) != 0)
        return true;
    auto name = simple_name();
    return name == "module-info" || name == "package-info";
}

// ============================================================================
// ClassFileReader
// ============================================================================

ClassFileReader::ClassFileReader(const std::vector<uint8_t>& data) : data_(data) {}

auto ClassFileReader::read() -> std::optional<ClassFile> {
    ClassFile cls;

    if (read_u4() != CLASS_FILE_MAGIC) {
        set_error("Invalid class file magic number");
        return std::nullopt;
    }
    cls.minor_version = read_u2();
    cls.major_version = read_u2();

    read_constant_pool();

    cls.access_flags = read_u2();
    cls.this_class = class_name_at(read_u2());
    uint16_t super_index = read_u2();
    if (super_index != 0) {
        cls.super_class = class_name_at(super_index);
    }

    uint16_t interface_count = read_u2();
    for (uint16_t i = 0; i < interface_count && !has_error_; ++i) {
        cls.interfaces.push_back(class_name_at(read_u2()));
    }

    uint16_t field_count = read_u2();
    for (uint16_t i = 0; i < field_count && !has_error_; ++i) {
        cls.fields.push_back(read_member());
    }

    uint16_t method_count = read_u2();
    for (uint16_t i = 0; i < method_count && !has_error_; ++i) {
        cls.methods.push_back(read_member());
    }

    read_class_attributes(cls);

    if (has_error_) {
        return std::nullopt;
    }
    return cls;
}

void ClassFileReader::set_error(const std::string& msg) {
    if (has_error_) {
        return;
    }
    has_error_ = true;
    error_ = msg + " (offset " + std::to_string(pos_) + ")";
}

// ============================================================================
// Primitive Reading
// ============================================================================

auto ClassFileReader::read_u1() -> uint8_t {
    if (has_error_) {
        return 0;
    }
    if (pos_ + 1 > data_.size()) {
        set_error("Unexpected end of class file");
        return 0;
    }
    return data_[pos_++];
}

auto ClassFileReader::read_u2() -> uint16_t {
    uint16_t hi = read_u1();
    uint16_t lo = read_u1();
    return static_cast<uint16_t>((hi << 8) | lo);
}

auto ClassFileReader::read_u4() -> uint32_t {
    uint32_t hi = read_u2();
    uint32_t lo = read_u2();
    return (hi << 16) | lo;
}

void ClassFileReader::skip(size_t count) {
    if (has_error_) {
        return;
    }
    if (count > data_.size() - pos_) {
        set_error("Unexpected end of class file");
        return;
    }
    pos_ += count;
}

// ============================================================================
// Constant Pool
// ============================================================================

void ClassFileReader::read_constant_pool() {
    uint16_t count = read_u2();
    if (has_error_) {
        return;
    }
    pool_.assign(count, Constant{});

    // Index 0 is unused
    for (uint16_t i = 1; i < count && !has_error_; ++i) {
        Constant& c = pool_[i];
        uint8_t tag = read_u1();
        c.tag = static_cast<ConstantTag>(tag);
        c.present = true;

        switch (c.tag) {
        case ConstantTag::Utf8: {
            uint16_t len = read_u2();
            if (!has_error_ && len > data_.size() - pos_) {
                set_error("Utf8 constant overruns class file");
                break;
            }
            if (!has_error_) {
                c.utf8.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
                pos_ += len;
            }
            break;
        }
        case ConstantTag::Integer:
        case ConstantTag::Float:
            skip(4);
            break;
        case ConstantTag::Long:
        case ConstantTag::Double:
            skip(8);
            ++i;
            break;
        case ConstantTag::Class:
        case ConstantTag::String:
        case ConstantTag::MethodType:
        case ConstantTag::Module:
        case ConstantTag::Package:
            c.index1 = read_u2();
            break;
        case ConstantTag::Fieldref:
        case ConstantTag::Methodref:
        case ConstantTag::InterfaceMethodref:
        case ConstantTag::NameAndType:
        case ConstantTag::Dynamic:
        case ConstantTag::InvokeDynamic:
            c.index1 = read_u2();
            c.index2 = read_u2();
            break;
        case ConstantTag::MethodHandle:
            c.index1 = read_u1();
            c.index2 = read_u2();
            break;
        default:
            set_error("Unknown constant pool tag " + std::to_string(tag) + " at index " +
                      std::to_string(i));
            break;
        }
    }
}

auto ClassFileReader::utf8_at(uint16_t index) -> std::string {
    if (has_error_) {
        return {};
    }
    if (index == 0 || index >= pool_.size() || !pool_[index].present ||
        pool_[index].tag != ConstantTag::Utf8) {
        set_error("Constant pool index " + std::to_string(index) + " is not a Utf8 entry");
        return {};
    }
    return pool_[index].utf8;
}

auto ClassFileReader::class_name_at(uint16_t index) -> std::string {
    if (has_error_) {
        return {};
    }
    if (index == 0 || index >= pool_.size() || !pool_[index].present ||
        pool_[index].tag != ConstantTag::Class) {
        set_error("Constant pool index " + std::to_string(index) + " is not a Class entry");
        return {};
    }
    return utf8_at(pool_[index].index1);
}

// ============================================================================
// Members and Attributes
// ============================================================================

auto ClassFileReader::read_member() -> RawMember {
    RawMember member;
    member.access_flags = read_u2();
    member.name = utf8_at(read_u2());
    member.descriptor = utf8_at(read_u2());

    uint16_t attribute_count = read_u2();
    for (uint16_t i = 0; i < attribute_count && !has_error_; ++i) {
        std::string name = utf8_at(read_u2());
        uint32_t length = read_u4();
        if (name == "Synthetic") {
            member.synthetic_attribute = true;
        }
        skip(length);
    }
    return member;
}

void ClassFileReader::read_class_attributes(ClassFile& cls) {
    uint16_t attribute_count = read_u2();
    for (uint16_t i = 0; i < attribute_count && !has_error_; ++i) {
        std::string name = utf8_at(read_u2());
        uint32_t length = read_u4();
        if (name != "InnerClasses") {
            skip(length);
            continue;
        }

        size_t start = pos_;
        uint16_t entry_count = read_u2();
        for (uint16_t j = 0; j < entry_count && !has_error_; ++j) {
            InnerClassEntry entry;
            entry.inner_class = class_name_at(read_u2());
            uint16_t outer_index = read_u2();
            uint16_t name_index = read_u2();
            entry.access_flags = read_u2();
            if (outer_index != 0) {
                entry.outer_class = class_name_at(outer_index);
            }
            if (name_index != 0) {
                entry.inner_name = utf8_at(name_index);
            }
            cls.inner_classes.push_back(std::move(entry));
        }
        if (!has_error_ && pos_ - start != length) {
            set_error("InnerClasses attribute length mismatch");
        }
    }
}

// ============================================================================
// Entry Points
// ============================================================================

auto parse_class_file(const std::vector<uint8_t>& data, const std::string& path)
    -> Result<ClassFile, ClassFileError> {
    ClassFileReader reader(data);
    auto cls = reader.read();
    if (!cls) {
        return ClassFileError{path, reader.error_message()};
    }
    return std::move(*cls);
}

auto read_class_file(const std::filesystem::path& path) -> Result<ClassFile, ClassFileError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ClassFileError{path.string(), "cannot open file"};
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return ClassFileError{path.string(), "read failed"};
    }
    return parse_class_file(data, path.string());
}

auto member_infos(const ClassFile& cls) -> std::vector<model::MemberInfo> {
    std::vector<model::MemberInfo> members;
    members.reserve(cls.fields.size() + cls.methods.size());

    auto convert = [](const RawMember& raw, model::MemberKind kind) {
        model::MemberInfo info;
        info.kind = kind;
        info.name = raw.name;
        info.descriptor = raw.descriptor;
        info.is_public = raw.is_public();
        info.is_protected = (raw.access_flags & access::PROTECTED) != 0;
        info.is_synthetic = raw.is_synthetic();
        info.is_bridge = kind == model::MemberKind::Method && (raw.access_flags & access::BRIDGE) != 0;
        return info;
    };

    for (const auto& field : cls.fields) {
        members.push_back(convert(field, model::MemberKind::Field));
    }
    for (const auto& method : cls.methods) {
        members.push_back(convert(method, model::MemberKind::Method));
    }
    return members;
}

auto to_class_descriptor(const ClassFile& cls, const model::MemberPolicy& policy)
    -> model::ClassDescriptor {
    return model::ClassDescriptor::from_members(cls.package_path(), cls.simple_name(),
                                                member_infos(cls), cls.kind(), policy);
}

} // namespace tplid::loader
