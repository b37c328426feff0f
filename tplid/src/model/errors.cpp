#include "tplid/model/errors.hpp"

#include <sstream>

namespace tplid::model {

auto MalformedPathError::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "malformed package path for class '" << class_name << "': segment " << segment_index
        << " " << reason;
    return oss.str();
}

auto EmptyFingerprintError::to_string() const -> std::string {
    if (library.empty()) {
        return "empty fingerprint: no classes";
    }
    return "empty fingerprint for library '" + library + "': no classes";
}

auto error_message(const FingerprintError& error) -> std::string {
    return std::visit([](const auto& e) { return e.to_string(); }, error);
}

auto MultipleRootsWarning::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "library contains multiple root packages (" << roots.size() << "):";
    for (const auto& root : roots) {
        oss << " " << join_path(root);
    }
    return oss.str();
}

auto warning_message(const FingerprintWarning& warning) -> std::string {
    return std::visit([](const auto& w) { return w.to_string(); }, warning);
}

} // namespace tplid::model
