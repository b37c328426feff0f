//! # Class Descriptors
//!
//! The normalized view of one class: where it lives, what it exposes, and a
//! content hash over what it exposes.
//!
//! The content hash is a pure function of the member signature set. The
//! class's simple name and package never enter it, so a class renamed by an
//! obfuscator keeps its content hash.

#pragma once

#include "tplid/common.hpp"
#include "tplid/common/hash.hpp"
#include "tplid/model/signature.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tplid::model {

// ============================================================================
// Class Kind
// ============================================================================

/// Closed set of class kinds.
enum class ClassKind : uint8_t {
    TopLevel = 0,
    Inner = 1,
    Anonymous = 2,
    Synthetic = 3,
    Interface = 4,
    Enum = 5,
};

/// Number of ClassKind values.
constexpr size_t CLASS_KIND_COUNT = 6;

/// Returns the lower-case name of a class kind (e.g. "top-level").
[[nodiscard]] auto class_kind_name(ClassKind kind) -> const char*;

/// Decodes a serialized class kind byte.
[[nodiscard]] auto class_kind_from_u8(uint8_t value) -> std::optional<ClassKind>;

/// Derives the class kind from JVM facts.
///
/// Interface and enum flags win, then the synthetic flag, then the binary
/// name: `Outer$12` is anonymous, any other `$` makes an inner class.
[[nodiscard]] auto classify_class(std::string_view binary_simple_name, bool is_interface,
                                  bool is_enum, bool is_synthetic) -> ClassKind;

// ============================================================================
// ClassDescriptor
// ============================================================================

/// A class reduced to its package path and normalized public API.
struct ClassDescriptor {
    PackagePath package_path;
    std::string simple_name;
    std::set<std::string> member_signatures;
    Hash128 content_hash;
    ClassKind kind = ClassKind::TopLevel;

    /// Builds a descriptor and computes its content hash.
    [[nodiscard]] static auto make(PackagePath package_path, std::string simple_name,
                                   std::set<std::string> member_signatures,
                                   ClassKind kind = ClassKind::TopLevel) -> ClassDescriptor;

    /// Builds a descriptor from raw members, applying the member policy.
    [[nodiscard]] static auto from_members(PackagePath package_path, std::string simple_name,
                                           const std::vector<MemberInfo>& members,
                                           ClassKind kind, const MemberPolicy& policy)
        -> ClassDescriptor;

    /// Returns `com.example.Foo`.
    [[nodiscard]] auto qualified_name() const -> std::string;
};

/// Content hash over a set of normalized member signatures.
///
/// Each signature is hashed on its own and the per-member hashes are combined
/// order-independently. A class with no public members still gets a defined,
/// non-zero hash.
[[nodiscard]] auto compute_content_hash(const std::set<std::string>& member_signatures)
    -> Hash128;

/// Returns the classes the policy admits into tree construction.
[[nodiscard]] auto apply_class_policy(std::vector<ClassDescriptor> classes,
                                      const MemberPolicy& policy) -> std::vector<ClassDescriptor>;

} // namespace tplid::model
