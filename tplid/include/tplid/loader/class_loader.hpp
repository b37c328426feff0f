//! # Class Hierarchy Loader
//!
//! Turns an extracted library or application (a directory tree of `.class`
//! files) into the class descriptors the fingerprint model consumes.
//!
//! ## Example
//!
//! ```cpp
//! ClassHierarchyLoader loader(policy);
//! auto loaded = loader.load_directory("build/okhttp-3.12.0");
//! auto fp = model::make_fingerprint(desc, std::move(loaded.classes));
//! ```
//!
//! Unreadable class files are logged, recorded in `LoadResult::errors` and
//! left out. Loading itself does not fail.

#pragma once

#include "tplid/loader/class_file.hpp"
#include "tplid/model/class_descriptor.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace tplid::loader {

/// Everything read from one input.
struct LoadResult {
    /// Normalized classes after the class policy.
    std::vector<model::ClassDescriptor> classes;

    /// Parsed class files in path order, before the class policy.
    std::vector<ClassFile> class_files;

    std::vector<ClassFileError> errors;
    size_t files_scanned = 0;

    /// `module-info` and `package-info` files left out of `classes`.
    size_t metadata_skipped = 0;
};

/// Loads class files and normalizes them under a member policy.
class ClassHierarchyLoader {
public:
    explicit ClassHierarchyLoader(model::MemberPolicy policy = {});

    /// Loads every `*.class` below `root` outside `META-INF/`, in sorted path
    /// order. Metadata classes are counted, not loaded.
    auto load_directory(const std::filesystem::path& root) const -> LoadResult;

    /// Loads the given class files in the order given.
    auto load_files(const std::vector<std::filesystem::path>& files) const -> LoadResult;

    [[nodiscard]] auto policy() const -> const model::MemberPolicy& {
        return policy_;
    }

private:
    model::MemberPolicy policy_;
};

/// Lists the `.class` files below a directory, sorted. `META-INF/` subtrees
/// (multi-release copies) are not entered.
[[nodiscard]] auto find_class_files(const std::filesystem::path& root)
    -> std::vector<std::filesystem::path>;

// ============================================================================
// Class Hierarchy Statistics
// ============================================================================

/// Summary of a loaded class hierarchy, printed by `tplid stats` and
/// `tplid profile`.
struct ChaStats {
    size_t class_count = 0;
    size_t inner_class_count = 0;
    size_t public_class_count = 0;
    std::array<size_t, model::CLASS_KIND_COUNT> kind_counts{};

    /// Distinct public method signatures (`com/a/B.run(I)V`).
    size_t public_method_count = 0;

    /// Methods that are not public. Bridge and synthetic methods are not
    /// counted at all.
    size_t non_accessible_method_count = 0;

    [[nodiscard]] auto method_count() const -> size_t {
        return public_method_count + non_accessible_method_count;
    }
};

[[nodiscard]] auto compute_cha_stats(const std::vector<ClassFile>& class_files) -> ChaStats;

/// Multi-line human-readable rendering.
[[nodiscard]] auto format_cha_stats(const ChaStats& stats) -> std::string;

} // namespace tplid::loader
