//! # Fingerprint Errors and Warnings
//!
//! Closed error and warning types produced while turning a set of class
//! descriptors into a library fingerprint.
//!
//! | Type                   | Effect                                          |
//! |------------------------|-------------------------------------------------|
//! | `MalformedPathError`   | Aborts fingerprinting of that artifact          |
//! | `EmptyFingerprintError`| Artifact is skipped, nothing is persisted       |
//! | `MultipleRootsWarning` | Fingerprinting proceeds with a synthetic root   |
//!
//! ## Example
//!
//! ```cpp
//! auto result = PackageTree::build(classes);
//! if (is_err(result)) {
//!     std::cerr << error_message(unwrap_err(result)) << "\n";
//! }
//! ```

#pragma once

#include "tplid/common.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tplid::model {

/// A class whose package path has an empty or invalid segment.
struct MalformedPathError {
    /// Qualified name of the offending class as far as it can be rendered.
    std::string class_name;

    /// The rejected package path.
    PackagePath path;

    /// Index of the first bad segment.
    size_t segment_index = 0;

    /// What is wrong with the segment.
    std::string reason;

    static auto make(std::string class_name, PackagePath path, size_t segment_index,
                     std::string reason) -> MalformedPathError {
        return MalformedPathError{std::move(class_name), std::move(path), segment_index,
                                  std::move(reason)};
    }

    [[nodiscard]] auto to_string() const -> std::string;
};

/// A fingerprint that would contain no classes.
struct EmptyFingerprintError {
    /// Library name, when known.
    std::string library;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Errors that abort fingerprinting of one artifact.
using FingerprintError = std::variant<MalformedPathError, EmptyFingerprintError>;

/// Renders any fingerprint error as a single line.
[[nodiscard]] auto error_message(const FingerprintError& error) -> std::string;

/// Classes do not share one root package.
struct MultipleRootsWarning {
    /// Paths of the disjoint root packages, sorted.
    std::vector<PackagePath> roots;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Non-fatal data-quality conditions.
using FingerprintWarning = std::variant<MultipleRootsWarning>;

[[nodiscard]] auto warning_message(const FingerprintWarning& warning) -> std::string;

} // namespace tplid::model
