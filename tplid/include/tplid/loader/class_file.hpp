//! # JVM Class Files
//!
//! Reads compiled `.class` files into the facts fingerprinting needs: the
//! class's binary name and access flags, its members with their type
//! descriptors, and the InnerClasses attribute. Code, annotations and every
//! other attribute are skipped.
//!
//! ## Layout (big-endian)
//!
//! ```text
//! u4 magic = 0xCAFEBABE
//! u2 minor_version, u2 major_version
//! u2 constant_pool_count, cp_info[count - 1]
//! u2 access_flags, u2 this_class, u2 super_class
//! u2 interfaces_count, u2[interfaces_count]
//! u2 fields_count, field_info[]
//! u2 methods_count, method_info[]
//! u2 attributes_count, attribute_info[]
//! ```

#pragma once

#include "tplid/common.hpp"
#include "tplid/model/class_descriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tplid::loader {

constexpr uint32_t CLASS_FILE_MAGIC = 0xCAFEBABE;

/// JVM access flag bits.
namespace access {
constexpr uint16_t PUBLIC = 0x0001;
constexpr uint16_t PRIVATE = 0x0002;
constexpr uint16_t PROTECTED = 0x0004;
constexpr uint16_t STATIC = 0x0008;
constexpr uint16_t FINAL = 0x0010;
constexpr uint16_t BRIDGE = 0x0040; ///< methods only
constexpr uint16_t INTERFACE = 0x0200;
constexpr uint16_t ABSTRACT = 0x0400;
constexpr uint16_t SYNTHETIC = 0x1000;
constexpr uint16_t ANNOTATION = 0x2000;
constexpr uint16_t ENUM = 0x4000;
constexpr uint16_t MODULE = 0x8000; ///< module-info only
} // namespace access

/// Constant pool tags.
enum class ConstantTag : uint8_t {
    Utf8 = 1,
    Integer = 3,
    Float = 4,
    Long = 5,
    Double = 6,
    Class = 7,
    String = 8,
    Fieldref = 9,
    Methodref = 10,
    InterfaceMethodref = 11,
    NameAndType = 12,
    MethodHandle = 15,
    MethodType = 16,
    Dynamic = 17,
    InvokeDynamic = 18,
    Module = 19,
    Package = 20,
};

/// A field or method as declared in the class file.
struct RawMember {
    std::string name;
    std::string descriptor;
    uint16_t access_flags = 0;
    bool synthetic_attribute = false; ///< Pre-Java 5 `Synthetic` attribute

    [[nodiscard]] bool is_public() const {
        return (access_flags & access::PUBLIC) != 0;
    }

    [[nodiscard]] bool is_synthetic() const {
        return synthetic_attribute || (access_flags & access::SYNTHETIC) != 0;
    }
};

/// One entry of the InnerClasses attribute.
struct InnerClassEntry {
    std::string inner_class; ///< Binary name, e.g. `com/a/Outer$Inner`
    std::string outer_class; ///< Empty for local and anonymous classes
    std::string inner_name;  ///< Empty for anonymous classes
    uint16_t access_flags = 0;
};

/// The parsed parts of a class file.
struct ClassFile {
    uint16_t minor_version = 0;
    uint16_t major_version = 0;
    uint16_t access_flags = 0;
    std::string this_class;  ///< Binary name, e.g. `com/a/Outer$1`
    std::string super_class; ///< Empty for java/lang/Object
    std::vector<std::string> interfaces;
    std::vector<RawMember> fields;
    std::vector<RawMember> methods;
    std::vector<InnerClassEntry> inner_classes;

    /// Package segments of `this_class`.
    [[nodiscard]] auto package_path() const -> PackagePath;

    /// Last segment of `this_class`, including any `$` parts.
    [[nodiscard]] auto simple_name() const -> std::string;

    /// Access flags of the class itself, taken from its own InnerClasses
    /// entry when it is a nested class.
    [[nodiscard]] auto effective_access_flags() const -> uint16_t;

    [[nodiscard]] bool is_inner() const;

    [[nodiscard]] bool is_public() const {
        return (effective_access_flags() & access::PUBLIC) != 0;
    }

    [[nodiscard]] auto kind() const -> model::ClassKind;

    /// True for `module-info` and `package-info`, which carry annotations or
    /// module metadata rather than a type.
    [[nodiscard]] bool is_metadata() const;
};

/// A class file that could not be read.
struct ClassFileError {
    std::string path;
    std::string reason;

    [[nodiscard]] auto to_string() const -> std::string {
        return path + ": " + reason;
    }
};

/// Parses class file bytes.
///
/// Soft error model like the profile reader: the first failure is kept and
/// `read()` returns `std::nullopt`.
class ClassFileReader {
public:
    explicit ClassFileReader(const std::vector<uint8_t>& data);

    auto read() -> std::optional<ClassFile>;

    [[nodiscard]] auto has_error() const -> bool {
        return has_error_;
    }

    [[nodiscard]] auto error_message() const -> std::string {
        return error_;
    }

private:
    struct Constant {
        ConstantTag tag = ConstantTag::Utf8;
        std::string utf8;
        uint16_t index1 = 0;
        uint16_t index2 = 0;
        bool present = false;
    };

    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
    bool has_error_ = false;
    std::string error_;
    std::vector<Constant> pool_;

    void set_error(const std::string& msg);

    auto read_u1() -> uint8_t;
    auto read_u2() -> uint16_t;
    auto read_u4() -> uint32_t;
    void skip(size_t count);

    void read_constant_pool();
    auto utf8_at(uint16_t index) -> std::string;
    auto class_name_at(uint16_t index) -> std::string;

    auto read_member() -> RawMember;
    void read_class_attributes(ClassFile& cls);
};

/// Parses a class file from memory.
[[nodiscard]] auto parse_class_file(const std::vector<uint8_t>& data, const std::string& path)
    -> Result<ClassFile, ClassFileError>;

/// Reads and parses a class file from disk.
[[nodiscard]] auto read_class_file(const std::filesystem::path& path)
    -> Result<ClassFile, ClassFileError>;

/// Turns a class file's fields and methods into member infos.
[[nodiscard]] auto member_infos(const ClassFile& cls) -> std::vector<model::MemberInfo>;

/// Builds the normalized descriptor of a class under a member policy.
[[nodiscard]] auto to_class_descriptor(const ClassFile& cls, const model::MemberPolicy& policy)
    -> model::ClassDescriptor;

} // namespace tplid::loader
