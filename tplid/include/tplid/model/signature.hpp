//! # Member Signature Normalization
//!
//! Turns raw class members (name, JVM type descriptor, access bits) into the
//! normalized signature strings that class content hashes are computed from.
//!
//! ## Fuzzy Descriptors
//!
//! Reference types that belong to the library itself are renamed by
//! obfuscators, so they are replaced by the placeholder `X`. Types under a
//! framework prefix (`java/`, `android/`, ...) survive obfuscation and are kept.
//!
//! | Raw descriptor                          | Fuzzy descriptor            |
//! |-----------------------------------------|-----------------------------|
//! | `(Ljava/lang/String;Lcom/a/B;)V`        | `(Ljava/lang/String;X)V`    |
//! | `([Lcom/a/B;I)[J`                       | `([XI)[J`                   |
//! | `Landroid/view/View;`                   | `Landroid/view/View;`       |
//!
//! ## Signature Text
//!
//! | Member | Names dropped (default) | Names kept           |
//! |--------|-------------------------|----------------------|
//! | method | `M:(X)V`                | `M:run(X)V`          |
//! | field  | `F:I`                   | `F:count:I`          |

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tplid::model {

/// Kind of class member.
enum class MemberKind : uint8_t {
    Method,
    Field,
};

/// A class member as reported by the class-hierarchy loader.
struct MemberInfo {
    MemberKind kind = MemberKind::Method;
    std::string name;
    std::string descriptor; ///< JVM type descriptor, e.g. `(I)Ljava/lang/String;`
    bool is_public = false;
    bool is_protected = false;
    bool is_synthetic = false;
    bool is_bridge = false;
};

/// Prefixes (slash form) of types that are never renamed by obfuscators.
[[nodiscard]] auto default_framework_prefixes() -> std::vector<std::string>;

/// Controls which members contribute to a class's content hash and how.
struct MemberPolicy {
    /// Keep protected members in addition to public ones.
    bool include_protected = false;

    /// Keep member names in signatures. Off by default since obfuscators
    /// rename members.
    bool include_member_names = false;

    /// Drop synthetic classes before tree construction.
    bool exclude_synthetic_classes = true;

    std::vector<std::string> framework_prefixes = default_framework_prefixes();
};

/// Replaces non-framework reference types of a JVM descriptor with `X`.
///
/// Returns `std::nullopt` if the descriptor is malformed.
[[nodiscard]] auto fuzzy_descriptor(std::string_view descriptor,
                                    const std::vector<std::string>& framework_prefixes)
    -> std::optional<std::string>;

/// Normalizes one member, or returns `std::nullopt` if the policy excludes it
/// (not accessible, synthetic, bridge, static initializer, malformed type).
[[nodiscard]] auto normalize_member(const MemberInfo& member, const MemberPolicy& policy)
    -> std::optional<std::string>;

} // namespace tplid::model
