#include "tplid/config/config.hpp"

#include <fstream>
#include <iterator>

namespace tplid::config {

namespace {

auto read_text(const fs::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool in_unit_range(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // namespace

auto TplidConfig::validate() const -> std::string {
    if (!in_unit_range(matching.min_score))
        return "min-score must be between 0 and 1";
    if (!in_unit_range(matching.path_aware_weight))
        return "path-aware-weight must be between 0 and 1";
    if (!in_unit_range(matching.partial_class_weight))
        return "partial-class-weight must be between 0 and 1";
    for (const auto& prefix : profile.member_policy.framework_prefixes) {
        if (prefix.empty())
            return "framework-prefixes must not contain empty entries";
    }
    return "";
}

auto TplidConfig::load(const fs::path& path) -> Result<TplidConfig, std::string> {
    auto content = read_text(path);
    if (!content) {
        return std::string("cannot open " + path.string());
    }

    SimpleTomlParser parser(*content);
    auto config = parser.parse_config();
    if (!config) {
        return path.string() + ": " + parser.get_error();
    }

    std::string problem = config->validate();
    if (!problem.empty()) {
        return path.string() + ": " + problem;
    }
    return std::move(*config);
}

auto TplidConfig::load_from_current_dir() -> Result<TplidConfig, std::string> {
    fs::path config_path = fs::current_path() / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return TplidConfig{};
    }
    return load(config_path);
}

auto load_library_description(const fs::path& path)
    -> Result<model::LibraryDescription, std::string> {
    auto content = read_text(path);
    if (!content) {
        return std::string("cannot open " + path.string());
    }

    SimpleTomlParser parser(*content);
    auto desc = parser.parse_library();
    if (!desc) {
        return path.string() + ": " + parser.get_error();
    }
    return std::move(*desc);
}

} // namespace tplid::config
