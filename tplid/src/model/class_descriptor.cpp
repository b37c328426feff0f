#include "tplid/model/class_descriptor.hpp"

#include <algorithm>
#include <cctype>

namespace tplid::model {

auto class_kind_name(ClassKind kind) -> const char* {
    switch (kind) {
    case ClassKind::TopLevel:
        return "top-level";
    case ClassKind::Inner:
        return "inner";
    case ClassKind::Anonymous:
        return "anonymous";
    case ClassKind::Synthetic:
        return "synthetic";
    case ClassKind::Interface:
        return "interface";
    case ClassKind::Enum:
        return "enum";
    }
    return "unknown";
}

auto class_kind_from_u8(uint8_t value) -> std::optional<ClassKind> {
    if (value >= CLASS_KIND_COUNT) {
        return std::nullopt;
    }
    return static_cast<ClassKind>(value);
}

auto classify_class(std::string_view binary_simple_name, bool is_interface, bool is_enum,
                    bool is_synthetic) -> ClassKind {
    if (is_interface) {
        return ClassKind::Interface;
    }
    if (is_enum) {
        return ClassKind::Enum;
    }
    if (is_synthetic) {
        return ClassKind::Synthetic;
    }

    size_t dollar = binary_simple_name.rfind('$');
    if (dollar == std::string_view::npos) {
        return ClassKind::TopLevel;
    }

    auto tail = binary_simple_name.substr(dollar + 1);
    bool all_digits = !tail.empty() && std::all_of(tail.begin(), tail.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    return all_digits ? ClassKind::Anonymous : ClassKind::Inner;
}

auto compute_content_hash(const std::set<std::string>& member_signatures) -> Hash128 {
    std::vector<Hash128> member_hashes;
    member_hashes.reserve(member_signatures.size());
    for (const auto& sig : member_signatures) {
        member_hashes.push_back(hash_string(sig, HashDomain::Member));
    }
    return hash_unordered(std::move(member_hashes), HashDomain::Class);
}

auto ClassDescriptor::make(PackagePath package_path, std::string simple_name,
                           std::set<std::string> member_signatures, ClassKind kind)
    -> ClassDescriptor {
    ClassDescriptor desc;
    desc.package_path = std::move(package_path);
    desc.simple_name = std::move(simple_name);
    desc.member_signatures = std::move(member_signatures);
    desc.kind = kind;
    desc.content_hash = compute_content_hash(desc.member_signatures);
    return desc;
}

auto ClassDescriptor::from_members(PackagePath package_path, std::string simple_name,
                                   const std::vector<MemberInfo>& members, ClassKind kind,
                                   const MemberPolicy& policy) -> ClassDescriptor {
    std::set<std::string> signatures;
    for (const auto& member : members) {
        if (auto sig = normalize_member(member, policy)) {
            signatures.insert(std::move(*sig));
        }
    }
    return make(std::move(package_path), std::move(simple_name), std::move(signatures), kind);
}

auto ClassDescriptor::qualified_name() const -> std::string {
    if (package_path.empty()) {
        return simple_name;
    }
    return join_path(package_path) + "." + simple_name;
}

auto apply_class_policy(std::vector<ClassDescriptor> classes, const MemberPolicy& policy)
    -> std::vector<ClassDescriptor> {
    if (!policy.exclude_synthetic_classes) {
        return classes;
    }
    std::erase_if(classes, [](const ClassDescriptor& c) { return c.kind == ClassKind::Synthetic; });
    return classes;
}

} // namespace tplid::model
