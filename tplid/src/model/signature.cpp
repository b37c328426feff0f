//! # Member Signature Normalization
//!
//! Walks JVM type descriptors one field type at a time:
//!
//! ```text
//! FieldType  := BaseType | 'L' ClassName ';' | '[' FieldType
//! BaseType   := B C D F I J S Z
//! Method     := '(' FieldType* ')' (FieldType | 'V')
//! ```

#include "tplid/model/signature.hpp"

namespace tplid::model {

namespace {

bool is_base_type(char c) {
    switch (c) {
    case 'B':
    case 'C':
    case 'D':
    case 'F':
    case 'I':
    case 'J':
    case 'S':
    case 'Z':
        return true;
    default:
        return false;
    }
}

bool is_framework_type(std::string_view class_name, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (class_name.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

/// Appends the fuzzy form of the field type starting at `pos` and advances
/// `pos` past it. Returns false on malformed input.
bool fuzzy_field_type(std::string_view desc, size_t& pos, std::string& out,
                      const std::vector<std::string>& prefixes) {
    while (pos < desc.size() && desc[pos] == '[') {
        out += '[';
        ++pos;
    }
    if (pos >= desc.size()) {
        return false;
    }

    char c = desc[pos];
    if (is_base_type(c)) {
        out += c;
        ++pos;
        return true;
    }
    if (c != 'L') {
        return false;
    }

    size_t end = desc.find(';', pos);
    if (end == std::string_view::npos || end == pos + 1) {
        return false;
    }
    auto class_name = desc.substr(pos + 1, end - pos - 1);
    if (is_framework_type(class_name, prefixes)) {
        out.append(desc.substr(pos, end - pos + 1));
    } else {
        out += 'X';
    }
    pos = end + 1;
    return true;
}

} // namespace

auto default_framework_prefixes() -> std::vector<std::string> {
    return {"java/", "javax/", "android/", "dalvik/", "kotlin/", "org/w3c/", "org/xml/", "org/json/"};
}

auto fuzzy_descriptor(std::string_view descriptor,
                      const std::vector<std::string>& framework_prefixes)
    -> std::optional<std::string> {
    std::string out;
    out.reserve(descriptor.size());
    size_t pos = 0;

    if (descriptor.empty()) {
        return std::nullopt;
    }

    if (descriptor[0] != '(') {
        if (!fuzzy_field_type(descriptor, pos, out, framework_prefixes) ||
            pos != descriptor.size()) {
            return std::nullopt;
        }
        return out;
    }

    out += '(';
    ++pos;
    while (pos < descriptor.size() && descriptor[pos] != ')') {
        if (!fuzzy_field_type(descriptor, pos, out, framework_prefixes)) {
            return std::nullopt;
        }
    }
    if (pos >= descriptor.size()) {
        return std::nullopt;
    }
    out += ')';
    ++pos;

    if (pos < descriptor.size() && descriptor[pos] == 'V') {
        out += 'V';
        ++pos;
    } else if (!fuzzy_field_type(descriptor, pos, out, framework_prefixes)) {
        return std::nullopt;
    }
    if (pos != descriptor.size()) {
        return std::nullopt;
    }
    return out;
}

auto normalize_member(const MemberInfo& member, const MemberPolicy& policy)
    -> std::optional<std::string> {
    if (member.is_synthetic || member.is_bridge) {
        return std::nullopt;
    }
    bool accessible = member.is_public || (policy.include_protected && member.is_protected);
    if (!accessible) {
        return std::nullopt;
    }
    if (member.kind == MemberKind::Method && member.name == "<clinit>") {
        return std::nullopt;
    }

    auto fuzzy = fuzzy_descriptor(member.descriptor, policy.framework_prefixes);
    if (!fuzzy) {
        return std::nullopt;
    }

    std::string sig = member.kind == MemberKind::Method ? "M:" : "F:";
    if (policy.include_member_names) {
        sig += member.name;
        if (member.kind == MemberKind::Field) {
            sig += ':';
        }
    }
    sig += *fuzzy;
    return sig;
}

} // namespace tplid::model
