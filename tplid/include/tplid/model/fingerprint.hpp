//! # Library Fingerprints
//!
//! The persisted unit: a library description, the package tree built from the
//! library's classes, and one hash tree per root package.
//!
//! ## Example
//!
//! ```cpp
//! LibraryDescription desc{"OkHttp", "3.12.0", LibraryCategory::Utilities};
//! auto result = make_fingerprint(desc, std::move(classes));
//! if (is_err(result)) {
//!     // MalformedPathError or EmptyFingerprintError
//! }
//! auto& built = unwrap(result);
//! for (const auto& w : built.warnings) { ... }
//! ```

#pragma once

#include "tplid/common.hpp"
#include "tplid/model/class_descriptor.hpp"
#include "tplid/model/errors.hpp"
#include "tplid/model/hash_tree.hpp"
#include "tplid/model/package_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tplid::model {

// ============================================================================
// Library Description
// ============================================================================

/// Closed set of library categories.
enum class LibraryCategory : uint8_t {
    Advertising = 0,
    Analytics = 1,
    Android = 2,
    Cloud = 3,
    SocialMedia = 4,
    Tracker = 5,
    Utilities = 6,
    Unknown = 7,
};

constexpr size_t LIBRARY_CATEGORY_COUNT = 8;

/// Returns the category name, also used as the profile directory name.
[[nodiscard]] auto category_name(LibraryCategory category) -> const char*;

/// Parses a category name, ignoring case.
[[nodiscard]] auto parse_category(std::string_view name) -> std::optional<LibraryCategory>;

/// Identity and metadata of one library version.
struct LibraryDescription {
    std::string name;
    std::string version;
    LibraryCategory category = LibraryCategory::Unknown;
    std::string release_date; ///< `YYYY-MM-DD`, empty if unknown
    std::string comment;

    /// Returns "name version".
    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// LibraryFingerprint
// ============================================================================

/// A fingerprinted library version. Immutable once built.
class LibraryFingerprint {
public:
    LibraryFingerprint(LibraryDescription description, PackageTree package_tree,
                       std::vector<HashTree> hash_trees)
        : description_(std::move(description)), package_tree_(std::move(package_tree)),
          hash_trees_(std::move(hash_trees)) {}

    [[nodiscard]] auto description() const -> const LibraryDescription& {
        return description_;
    }

    [[nodiscard]] auto package_tree() const -> const PackageTree& {
        return package_tree_;
    }

    /// One tree per root package, in root path order.
    [[nodiscard]] auto hash_trees() const -> const std::vector<HashTree>& {
        return hash_trees_;
    }

    [[nodiscard]] auto root_layout() const -> const RootLayout& {
        return package_tree_.root_layout();
    }

    [[nodiscard]] auto class_count() const -> uint32_t {
        return package_tree_.class_count();
    }

    [[nodiscard]] auto child_order() const -> ChildOrder {
        return hash_trees_.empty() ? ChildOrder::SubtreeHash : hash_trees_.front().child_order();
    }

private:
    LibraryDescription description_;
    PackageTree package_tree_;
    std::vector<HashTree> hash_trees_;
};

/// A fingerprint together with the data-quality warnings raised building it.
struct FingerprintBuild {
    LibraryFingerprint fingerprint;
    std::vector<FingerprintWarning> warnings;
};

/// Builds a library fingerprint.
///
/// Fails with `MalformedPathError` on a bad package path and with
/// `EmptyFingerprintError` if no classes remain. Multiple root packages are
/// reported as a warning.
[[nodiscard]] auto make_fingerprint(LibraryDescription description,
                                    std::vector<ClassDescriptor> classes,
                                    const HashTreeOptions& options = {})
    -> Result<FingerprintBuild, FingerprintError>;

/// Builds the hash tree of an application to be matched, rooted at the empty
/// prefix so that every embedded library is a subtree of it.
[[nodiscard]] auto make_query_tree(std::vector<ClassDescriptor> classes,
                                   const HashTreeOptions& options = {})
    -> Result<HashTree, FingerprintError>;

} // namespace tplid::model
