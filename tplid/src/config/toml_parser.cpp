//! # TOML Subset Parser
//!
//! Recursive-descent reader for `tplid.toml` and `library.toml`. Each known
//! section has its own parse routine filling a settings struct; unknown
//! sections and keys are consumed and ignored. The first error stops parsing
//! and is reported as `Line N: message`.

#include "tplid/config/config.hpp"

#include <cctype>
#include <cstdlib>

namespace tplid::config {

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

// ============================================================================
// Lexing Helpers
// ============================================================================

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void SimpleTomlParser::skip_trivia() {
    size_t before;
    do {
        before = pos_;
        skip_whitespace();
        skip_comment();
    } while (pos_ != before);
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

auto SimpleTomlParser::parse_identifier() -> std::string {
    std::string result;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-')) {
        result += advance();
    }
    return result;
}

auto SimpleTomlParser::parse_string() -> std::string {
    if (peek() != '"') {
        set_error("Expected string");
        return "";
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return "";
    }
    advance(); // Skip closing quote

    return result;
}

auto SimpleTomlParser::parse_number() -> double {
    std::string num_str;
    if (peek() == '-' || peek() == '+') {
        num_str += advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.' ||
                         peek() == '_')) {
        char c = advance();
        if (c != '_')
            num_str += c;
    }

    char* end = nullptr;
    double value = std::strtod(num_str.c_str(), &end);
    if (num_str.empty() || end != num_str.c_str() + num_str.size()) {
        set_error("Expected number");
        return 0.0;
    }
    return value;
}

auto SimpleTomlParser::parse_boolean() -> bool {
    std::string value = parse_identifier();
    if (value != "true" && value != "false") {
        set_error("Expected boolean, got '" + value + "'");
        return false;
    }
    return value == "true";
}

auto SimpleTomlParser::parse_string_array() -> std::vector<std::string> {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("Expected array");
        return result;
    }
    advance(); // Skip '['

    skip_trivia();

    while (!is_eof() && peek() != ']') {
        result.push_back(parse_string());
        if (has_error())
            return result;

        skip_trivia();

        if (peek() == ',') {
            advance();
            skip_trivia();
        } else if (peek() != ']') {
            set_error("Expected ',' or ']' in array");
            return result;
        }
    }

    if (peek() != ']') {
        set_error("Expected closing bracket");
        return result;
    }
    advance(); // Skip ']'

    return result;
}

void SimpleTomlParser::skip_value() {
    if (peek() == '"') {
        parse_string();
        return;
    }
    if (peek() == '[') {
        int depth = 0;
        while (!is_eof()) {
            char c = peek();
            if (c == '"') {
                parse_string();
                if (has_error())
                    return;
                continue;
            }
            if (c == '\n')
                line_++;
            advance();
            if (c == '[') {
                depth++;
            } else if (c == ']' && --depth == 0) {
                return;
            }
        }
        set_error("Expected closing bracket");
        return;
    }
    while (!is_eof() && peek() != '\n' && peek() != '#') {
        advance();
    }
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (has_error())
        return;
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

// ============================================================================
// Structure
// ============================================================================

auto SimpleTomlParser::parse_section_header() -> std::optional<std::string> {
    advance(); // Skip '['

    std::string section = parse_identifier();
    while (peek() == '.') {
        section += advance();
        section += parse_identifier();
    }

    if (section.empty()) {
        set_error("Expected section name");
        return std::nullopt;
    }
    if (peek() != ']') {
        set_error("Expected ']' after section name");
        return std::nullopt;
    }
    advance(); // Skip ']'
    return section;
}

auto SimpleTomlParser::parse_key() -> std::optional<std::string> {
    skip_trivia();
    if (is_eof() || peek() == '[')
        return std::string();

    std::string key = parse_identifier();
    if (key.empty()) {
        set_error(std::string("Unexpected character '") + peek() + "'");
        return std::nullopt;
    }
    while (peek() == ' ' || peek() == '\t')
        advance();

    if (peek() != '=') {
        set_error("Expected '=' after key");
        return std::nullopt;
    }
    advance();
    while (peek() == ' ' || peek() == '\t')
        advance();
    return key;
}

bool SimpleTomlParser::parse_document(
    const std::function<bool(const std::string&)>& on_section) {
    while (true) {
        skip_trivia();
        if (is_eof())
            break;

        if (peek() != '[') {
            set_error("Key outside of a section");
            return false;
        }
        auto section = parse_section_header();
        if (!section || !on_section(*section))
            return false;
    }
    return !has_error();
}

bool SimpleTomlParser::skip_section() {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;
        skip_value();
        if (has_error())
            return false;
    }
}

// ============================================================================
// Sections
// ============================================================================

bool SimpleTomlParser::parse_matching_section(match::MatchConfig& matching) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "min-score") {
            matching.min_score = parse_number();
        } else if (*key == "path-aware") {
            matching.path_aware = parse_boolean();
        } else if (*key == "path-aware-weight") {
            matching.path_aware_weight = parse_number();
        } else if (*key == "partial-class-weight") {
            matching.partial_class_weight = parse_number();
        } else {
            skip_value();
        }

        if (has_error())
            return false;
    }
}

bool SimpleTomlParser::parse_profile_section(ProfileSettings& profile) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        auto& policy = profile.member_policy;
        if (*key == "include-member-names") {
            policy.include_member_names = parse_boolean();
        } else if (*key == "include-protected") {
            policy.include_protected = parse_boolean();
        } else if (*key == "exclude-synthetic-classes") {
            policy.exclude_synthetic_classes = parse_boolean();
        } else if (*key == "framework-prefixes") {
            policy.framework_prefixes = parse_string_array();
        } else if (*key == "parallel") {
            profile.parallel = parse_boolean();
        } else if (*key == "child-order") {
            std::string value = parse_string();
            if (has_error())
                return false;
            auto order = model::parse_child_order(value);
            if (!order) {
                set_error("Unknown child order '" + value + "'");
                return false;
            }
            profile.child_order = *order;
        } else {
            skip_value();
        }

        if (has_error())
            return false;
    }
}

bool SimpleTomlParser::parse_library_section(model::LibraryDescription& desc) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "name") {
            desc.name = parse_string();
        } else if (*key == "version") {
            desc.version = parse_string();
        } else if (*key == "comment") {
            desc.comment = parse_string();
        } else if (*key == "release-date") {
            desc.release_date = parse_string();
            if (!has_error() && !is_valid_release_date(desc.release_date)) {
                set_error("Invalid release date '" + desc.release_date + "' (expected YYYY-MM-DD)");
            }
        } else if (*key == "category") {
            std::string value = parse_string();
            if (has_error())
                return false;
            auto category = model::parse_category(value);
            if (!category) {
                set_error("Unknown category '" + value + "'");
                return false;
            }
            desc.category = *category;
        } else {
            skip_value();
        }

        if (has_error())
            return false;
    }
}

// ============================================================================
// Entry Points
// ============================================================================

auto SimpleTomlParser::parse_config() -> std::optional<TplidConfig> {
    TplidConfig config;

    bool ok = parse_document([&](const std::string& section) {
        if (section == "matching")
            return parse_matching_section(config.matching);
        if (section == "profile")
            return parse_profile_section(config.profile);
        return skip_section();
    });
    if (!ok)
        return std::nullopt;

    return config;
}

auto SimpleTomlParser::parse_library() -> std::optional<model::LibraryDescription> {
    model::LibraryDescription desc;
    bool seen = false;

    bool ok = parse_document([&](const std::string& section) {
        if (section == "library") {
            seen = true;
            return parse_library_section(desc);
        }
        return skip_section();
    });
    if (!ok)
        return std::nullopt;

    if (!seen) {
        set_error("Missing [library] section");
        return std::nullopt;
    }
    if (desc.name.empty() || desc.version.empty()) {
        set_error("[library] requires name and version");
        return std::nullopt;
    }
    return desc;
}

bool is_valid_release_date(const std::string& date) {
    if (date.empty())
        return true;
    if (date.size() != 10 || date[4] != '-' || date[7] != '-')
        return false;
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i])))
            return false;
    }
    int month = std::atoi(date.substr(5, 2).c_str());
    int day = std::atoi(date.substr(8, 2).c_str());
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace tplid::config
