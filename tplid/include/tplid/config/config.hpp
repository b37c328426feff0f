//! # Configuration Interface
//!
//! This header defines `tplid.toml` tool configuration and `library.toml`
//! library metadata parsing.
//!
//! ## Sections
//!
//! | File           | Section      | Type                 | Description              |
//! |----------------|--------------|----------------------|--------------------------|
//! | `tplid.toml`   | `[matching]` | `match::MatchConfig` | Threshold and weighting  |
//! | `tplid.toml`   | `[profile]`  | `ProfileSettings`    | Normalization, hashing   |
//! | `library.toml` | `[library]`  | `LibraryDescription` | Name, version, category  |
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML these files use.

#ifndef TPLID_CONFIG_CONFIG_HPP
#define TPLID_CONFIG_CONFIG_HPP

#include "tplid/match/matcher.hpp"
#include "tplid/model/fingerprint.hpp"
#include "tplid/model/hash_tree.hpp"
#include "tplid/model/signature.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace tplid::config {

/// Default configuration file name looked up in the working directory.
constexpr const char* CONFIG_FILE_NAME = "tplid.toml";

/// Default library metadata file name inside a library directory.
constexpr const char* LIBRARY_FILE_NAME = "library.toml";

/**
 * Fingerprinting settings from the [profile] section
 */
struct ProfileSettings {
    model::MemberPolicy member_policy;
    model::ChildOrder child_order = model::ChildOrder::SubtreeHash;
    bool parallel = false;

    auto hash_tree_options() const -> model::HashTreeOptions {
        return {child_order, parallel};
    }
};

/**
 * Complete tool configuration
 */
struct TplidConfig {
    match::MatchConfig matching;
    ProfileSettings profile;

    /**
     * Load configuration from a tplid.toml file
     * @param path Path to the file
     * @return Config, or the parse error ("Line N: ...") prefixed with the path
     */
    static auto load(const fs::path& path) -> Result<TplidConfig, std::string>;

    /**
     * Load tplid.toml from the current directory, or the defaults when
     * there is none
     */
    static auto load_from_current_dir() -> Result<TplidConfig, std::string>;

    /**
     * Check value ranges
     * @return Empty string if valid, otherwise the first problem found
     */
    auto validate() const -> std::string;
};

/**
 * Load library metadata from a library.toml file
 * @param path Path to the file
 * @return Description, or an error if the file is unreadable or lacks a
 *         name or version
 */
auto load_library_description(const fs::path& path)
    -> Result<model::LibraryDescription, std::string>;

/**
 * Simple TOML parser (subset of TOML spec)
 * Handles:
 * - Sections: [section]
 * - Key-value pairs: key = "value"
 * - Numbers: key = 0.5, key = 3
 * - Booleans: key = true
 * - Arrays: key = ["value1", "value2"]
 * - Comments: # to end of line
 *
 * Unknown sections and keys are skipped.
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse content as a tplid.toml file, starting from the defaults
     */
    auto parse_config() -> std::optional<TplidConfig>;

    /**
     * Parse content as a library.toml file
     */
    auto parse_library() -> std::optional<model::LibraryDescription>;

    /**
     * Get error message if parsing failed
     */
    auto get_error() const -> std::string {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_comment();
    void skip_trivia();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();
    bool has_error() const {
        return !error_message_.empty();
    }

    auto parse_identifier() -> std::string;
    auto parse_string() -> std::string;
    auto parse_number() -> double;
    auto parse_boolean() -> bool;
    auto parse_string_array() -> std::vector<std::string>;
    void skip_value();

    /// Walks the sections, handing each header to `on_section`, which must
    /// consume the section body.
    bool parse_document(const std::function<bool(const std::string&)>& on_section);

    /// Reads `[name]`, leaving the cursor after the closing bracket.
    auto parse_section_header() -> std::optional<std::string>;

    /// Reads `key =`, returning an empty key at the end of a section.
    auto parse_key() -> std::optional<std::string>;

    bool parse_matching_section(match::MatchConfig& matching);
    bool parse_profile_section(ProfileSettings& profile);
    bool parse_library_section(model::LibraryDescription& desc);
    bool skip_section();

    void set_error(const std::string& message);
};

/**
 * Validate a YYYY-MM-DD date string
 */
bool is_valid_release_date(const std::string& date);

} // namespace tplid::config

#endif // TPLID_CONFIG_CONFIG_HPP
