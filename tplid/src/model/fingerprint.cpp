#include "tplid/model/fingerprint.hpp"

#include <algorithm>
#include <cctype>

namespace tplid::model {

auto category_name(LibraryCategory category) -> const char* {
    switch (category) {
    case LibraryCategory::Advertising:
        return "Advertising";
    case LibraryCategory::Analytics:
        return "Analytics";
    case LibraryCategory::Android:
        return "Android";
    case LibraryCategory::Cloud:
        return "Cloud";
    case LibraryCategory::SocialMedia:
        return "SocialMedia";
    case LibraryCategory::Tracker:
        return "Tracker";
    case LibraryCategory::Utilities:
        return "Utilities";
    case LibraryCategory::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

auto parse_category(std::string_view name) -> std::optional<LibraryCategory> {
    auto lower = [](std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };

    std::string wanted = lower(name);
    for (size_t i = 0; i < LIBRARY_CATEGORY_COUNT; ++i) {
        auto category = static_cast<LibraryCategory>(i);
        if (lower(category_name(category)) == wanted) {
            return category;
        }
    }
    return std::nullopt;
}

auto LibraryDescription::to_string() const -> std::string {
    return name + " " + version;
}

auto make_fingerprint(LibraryDescription description, std::vector<ClassDescriptor> classes,
                      const HashTreeOptions& options) -> Result<FingerprintBuild, FingerprintError> {
    if (classes.empty()) {
        return FingerprintError{EmptyFingerprintError{description.name}};
    }

    auto tree_result = PackageTree::build(std::move(classes));
    if (is_err(tree_result)) {
        return unwrap_err(tree_result);
    }
    auto& package_tree = unwrap(tree_result);

    HashTreeBuilder builder(options);
    auto trees_result = builder.build_roots(package_tree);
    if (is_err(trees_result)) {
        auto& error = unwrap_err(trees_result);
        if (auto* empty = std::get_if<EmptyFingerprintError>(&error)) {
            empty->library = description.name;
        }
        return error;
    }

    std::vector<FingerprintWarning> warnings = package_tree.warnings();
    return FingerprintBuild{
        LibraryFingerprint(std::move(description), std::move(package_tree),
                           std::move(unwrap(trees_result))),
        std::move(warnings)};
}

auto make_query_tree(std::vector<ClassDescriptor> classes, const HashTreeOptions& options)
    -> Result<HashTree, FingerprintError> {
    auto tree_result = PackageTree::build(std::move(classes));
    if (is_err(tree_result)) {
        return unwrap_err(tree_result);
    }
    return HashTreeBuilder(options).build(unwrap(tree_result));
}

} // namespace tplid::model
