//! # Profile Command
//!
//! This file implements `tplid profile`, which fingerprints one library
//! version.
//!
//! ## Pipeline
//!
//! ```text
//! library.toml ──> LibraryDescription ─────────────┐
//! *.class ──> ClassHierarchyLoader ──> classes ──> make_fingerprint()
//!                                                   │
//!                       <profiles-dir>/<category>/<name>_<version>.lib
//! ```
//!
//! ## Options
//!
//! | Option                  | Description                                 |
//! |-------------------------|---------------------------------------------|
//! | `--library=<file>`      | Library metadata (default: `<dir>/library.toml`) |
//! | `--name=`, `--version=` | Override or replace the metadata file       |
//! | `--category=<name>`     | Library category                            |
//! | `--release-date=<date>` | `YYYY-MM-DD`                                |
//! | `--profiles-dir=<dir>`  | Output root (default: `profiles`)           |
//! | `--stats`               | Print class hierarchy statistics            |

#include "cmd_profile.hpp"

#include "cli/utils.hpp"
#include "tplid/loader/class_loader.hpp"
#include "tplid/log/log.hpp"
#include "tplid/model/fingerprint.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <variant>

namespace fs = std::filesystem;

namespace tplid::cli {

namespace {

void print_profile_usage() {
    std::cerr << "Usage: tplid profile <class-dir> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --library=<file>       Library metadata (default: <class-dir>/library.toml)\n";
    std::cerr << "  --name=<name>          Library name\n";
    std::cerr << "  --version=<version>    Library version\n";
    std::cerr << "  --category=<category>  Advertising, Analytics, Android, Cloud,\n";
    std::cerr << "                         SocialMedia, Tracker, Utilities, Unknown\n";
    std::cerr << "  --release-date=<date>  Release date (YYYY-MM-DD)\n";
    std::cerr << "  --profiles-dir=<dir>   Output directory (default: profiles)\n";
    std::cerr << "  --config=<file>        Configuration file\n";
    std::cerr << "  --stats                Print class hierarchy statistics\n";
}

} // namespace

int run_profile(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[2]).starts_with("-")) {
        print_profile_usage();
        return 1;
    }

    fs::path input = argv[2];
    std::string library_file;
    std::string config_file;
    fs::path profiles_dir = "profiles";
    bool show_stats = false;

    model::LibraryDescription overrides;
    std::string category_override;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--library=")) {
            library_file = arg.substr(10);
        } else if (arg.starts_with("--name=")) {
            overrides.name = arg.substr(7);
        } else if (arg.starts_with("--version=")) {
            overrides.version = arg.substr(10);
        } else if (arg.starts_with("--category=")) {
            category_override = arg.substr(11);
        } else if (arg.starts_with("--release-date=")) {
            overrides.release_date = arg.substr(15);
        } else if (arg.starts_with("--profiles-dir=")) {
            profiles_dir = arg.substr(15);
        } else if (arg.starts_with("--config=")) {
            config_file = arg.substr(9);
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (!is_log_option(arg)) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            print_profile_usage();
            return 1;
        }
    }

    auto settings = load_config(config_file);
    if (!settings) {
        return 1;
    }

    // Library description: metadata file first, then command-line overrides
    model::LibraryDescription desc;
    if (library_file.empty() && fs::exists(input / config::LIBRARY_FILE_NAME)) {
        library_file = (input / config::LIBRARY_FILE_NAME).string();
    }
    if (!library_file.empty()) {
        auto loaded = config::load_library_description(library_file);
        if (is_err(loaded)) {
            TPLID_LOG_ERROR("profile", "Invalid library description: " << unwrap_err(loaded));
            return 1;
        }
        desc = std::move(unwrap(loaded));
    }
    if (!overrides.name.empty())
        desc.name = overrides.name;
    if (!overrides.version.empty())
        desc.version = overrides.version;
    if (!overrides.release_date.empty()) {
        if (!config::is_valid_release_date(overrides.release_date)) {
            std::cerr << "error: invalid release date '" << overrides.release_date
                      << "' (expected YYYY-MM-DD)\n";
            return 1;
        }
        desc.release_date = overrides.release_date;
    }
    if (!category_override.empty()) {
        auto category = model::parse_category(category_override);
        if (!category) {
            std::cerr << "error: unknown category '" << category_override << "'\n";
            return 1;
        }
        desc.category = *category;
    }
    if (desc.name.empty() || desc.version.empty()) {
        std::cerr << "error: library name and version are required (library.toml or "
                     "--name/--version)\n";
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    TPLID_LOG_INFO("profile", "Process library: " << desc.to_string() << " ("
                                                  << model::category_name(desc.category) << ")");

    loader::ClassHierarchyLoader class_loader(settings->profile.member_policy);
    auto loaded = class_loader.load_directory(input);

    auto stats = loader::compute_cha_stats(loaded.class_files);
    if (show_stats) {
        std::cout << loader::format_cha_stats(stats);
    } else {
        TPLID_LOG_DEBUG("profile", "Class hierarchy stats:\n" << loader::format_cha_stats(stats));
    }

    auto built = model::make_fingerprint(desc, std::move(loaded.classes),
                                         settings->profile.hash_tree_options());
    if (is_err(built)) {
        const auto& error = unwrap_err(built);
        if (std::holds_alternative<model::EmptyFingerprintError>(error)) {
            TPLID_LOG_ERROR("profile", "Empty hash tree generated for " << desc.to_string()
                                                                        << " - SKIP");
        } else {
            TPLID_LOG_ERROR("profile", model::error_message(error));
        }
        return 1;
    }

    auto& build = unwrap(built);
    for (const auto& warning : build.warnings) {
        TPLID_LOG_WARN("profile", model::warning_message(warning));
    }

    fs::path target = profiles_dir / serialize::profile_relative_path(desc);
    TPLID_LOG_INFO("profile", "Serialize library fingerprint to " << target.string());
    if (!serialize::write_profile_file(build.fingerprint, target)) {
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "Wrote " << target.string() << " (" << build.fingerprint.class_count()
              << " classes, " << build.fingerprint.hash_trees().size() << " hash tree"
              << (build.fingerprint.hash_trees().size() == 1 ? "" : "s") << ")\n";
    TPLID_LOG_INFO("profile", "Processing time: " << elapsed.count() << " ms");
    return 0;
}

} // namespace tplid::cli
