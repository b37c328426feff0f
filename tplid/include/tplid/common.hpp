//! # Common Definitions
//!
//! Common types and utilities shared by every tplid component.
//!
//! Fallible operations return `Result<T, E>` instead of throwing. Package
//! paths are segment vectors; the dotted form is only for display.

#ifndef TPLID_COMMON_HPP
#define TPLID_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tplid {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Package Paths
// ============================================================================

/// A package path as an ordered list of segments (`["com", "example", "util"]`).
using PackagePath = std::vector<std::string>;

/// Joins a package path with the given separator (`com.example.util`).
///
/// The empty path is rendered as `<root>`.
[[nodiscard]] inline auto join_path(const PackagePath& path, char sep = '.') -> std::string {
    if (path.empty()) {
        return "<root>";
    }
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += path[i];
    }
    return out;
}

/// Splits a dotted or slashed package name into segments.
///
/// Empty segments are preserved so that callers can reject them.
[[nodiscard]] inline auto split_path(std::string_view name) -> PackagePath {
    PackagePath out;
    if (name.empty()) {
        return out;
    }
    size_t start = 0;
    for (size_t i = 0; i <= name.size(); ++i) {
        if (i == name.size() || name[i] == '.' || name[i] == '/') {
            out.emplace_back(name.substr(start, i - start));
            start = i + 1;
        }
    }
    return out;
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<PackageTree, FingerprintError> tree = PackageTree::build(classes);
/// if (is_ok(tree)) {
///     auto& t = unwrap(tree);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace tplid

#endif // TPLID_COMMON_HPP
