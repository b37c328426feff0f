//! # Class Hierarchy Loader
//!
//! Directory scan, per-file parsing and normalization, and hierarchy
//! statistics.

#include "tplid/loader/class_loader.hpp"

#include "tplid/log/log.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace tplid::loader {

namespace fs = std::filesystem;

ClassHierarchyLoader::ClassHierarchyLoader(model::MemberPolicy policy)
    : policy_(std::move(policy)) {}

auto find_class_files(const fs::path& root) -> std::vector<fs::path> {
    std::vector<fs::path> files;
    std::error_code ec;

    if (fs::is_regular_file(root, ec) && root.extension() == ".class") {
        files.push_back(root);
        return files;
    }

    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        // META-INF/versions/N/ repeats classes of the base layer
        if (it->is_directory(ec) && it->path().filename() == "META-INF") {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(ec) && it->path().extension() == ".class") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        TPLID_LOG_WARN("loader", "Directory scan of " << root.string()
                                                      << " stopped early: " << ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto ClassHierarchyLoader::load_directory(const fs::path& root) const -> LoadResult {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        LoadResult result;
        result.errors.push_back(ClassFileError{root.string(), "no such file or directory"});
        TPLID_LOG_ERROR("loader", "Input not found: " << root.string());
        return result;
    }

    TPLID_LOG_DEBUG("loader", "Scanning " << root.string());
    return load_files(find_class_files(root));
}

auto ClassHierarchyLoader::load_files(const std::vector<fs::path>& files) const -> LoadResult {
    LoadResult result;
    std::vector<model::ClassDescriptor> classes;
    classes.reserve(files.size());

    for (const auto& file : files) {
        ++result.files_scanned;

        auto parsed = read_class_file(file);
        if (is_err(parsed)) {
            TPLID_LOG_WARN("loader", "Skipping class file " << unwrap_err(parsed).to_string());
            result.errors.push_back(std::move(unwrap_err(parsed)));
            continue;
        }

        auto& cls = unwrap(parsed);
        if (cls.is_metadata()) {
            TPLID_LOG_TRACE("loader", "Skipping metadata class " << cls.this_class);
            ++result.metadata_skipped;
            continue;
        }

        auto descriptor = to_class_descriptor(cls, policy_);
        TPLID_LOG_TRACE("loader", "Class " << descriptor.qualified_name() << " ("
                                           << model::class_kind_name(descriptor.kind) << ", "
                                           << descriptor.member_signatures.size() << " members)");
        classes.push_back(std::move(descriptor));
        result.class_files.push_back(std::move(cls));
    }

    size_t before_policy = classes.size();
    result.classes = model::apply_class_policy(std::move(classes), policy_);
    if (result.classes.size() != before_policy) {
        TPLID_LOG_DEBUG("loader", "Class policy dropped " << before_policy - result.classes.size()
                                                          << " synthetic classes");
    }

    TPLID_LOG_INFO("loader", "Loaded " << result.classes.size() << " classes from "
                                       << result.files_scanned << " files ("
                                       << result.errors.size() << " unreadable, "
                                       << result.metadata_skipped << " metadata)");
    return result;
}

// ============================================================================
// Class Hierarchy Statistics
// ============================================================================

auto compute_cha_stats(const std::vector<ClassFile>& class_files) -> ChaStats {
    ChaStats stats;
    std::set<std::string> public_methods;

    for (const auto& cls : class_files) {
        ++stats.class_count;
        ++stats.kind_counts[static_cast<size_t>(cls.kind())];
        if (cls.is_inner())
            ++stats.inner_class_count;
        if (cls.is_public())
            ++stats.public_class_count;

        for (const auto& method : cls.methods) {
            if (method.is_synthetic() || (method.access_flags & access::BRIDGE) != 0)
                continue;

            if (method.is_public()) {
                public_methods.insert(cls.this_class + "." + method.name + method.descriptor);
            } else {
                ++stats.non_accessible_method_count;
            }
        }
    }

    stats.public_method_count = public_methods.size();
    return stats;
}

auto format_cha_stats(const ChaStats& stats) -> std::string {
    std::ostringstream out;
    out << "= Class Hierarchy Stats =\n";
    out << "  classes: " << stats.class_count << "\n";
    out << "    inner classes: " << stats.inner_class_count << "\n";
    out << "    public classes: " << stats.public_class_count << "\n";
    for (size_t i = 0; i < model::CLASS_KIND_COUNT; ++i) {
        out << "    " << model::class_kind_name(static_cast<model::ClassKind>(i)) << ": "
            << stats.kind_counts[i] << "\n";
    }
    out << "  methods: " << stats.method_count() << "\n";
    out << "    publicly accessible: " << stats.public_method_count << "\n";
    out << "    non-accessible: " << stats.non_accessible_method_count << "\n";
    return out.str();
}

} // namespace tplid::loader
