//! # Inspection Commands
//!
//! This file implements `tplid dump` and `tplid stats`.
//!
//! ## Example Output
//!
//! ```text
//! $ tplid stats build/okhttp
//! = Class Hierarchy Stats =
//!   classes: 412
//!     inner classes: 96
//!   ...
//! = Package Tree =
//!   packages: 14
//!   root: com.squareup.okhttp3
//! ```

#include "cmd_inspect.hpp"

#include "cli/utils.hpp"
#include "tplid/loader/class_loader.hpp"
#include "tplid/log/log.hpp"
#include "tplid/model/package_tree.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace tplid::cli {

/// Prints a stored profile in the text format.
int run_dump(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: tplid dump <profile.lib> [--signatures]\n";
        return 1;
    }

    fs::path profile_file = argv[2];
    bool signatures = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--signatures") {
            signatures = true;
        } else if (!is_log_option(arg)) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return 1;
        }
    }

    auto fingerprint = serialize::read_profile_file(profile_file);
    if (is_err(fingerprint)) {
        TPLID_LOG_ERROR("dump", "Failed to read profile " << unwrap_err(fingerprint));
        return 1;
    }

    std::cout << serialize::serialize_profile_text(unwrap(fingerprint), signatures);
    return 0;
}

int run_stats(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: tplid stats <class-dir> [--config=<file>]\n";
        return 1;
    }

    fs::path input = argv[2];
    std::string config_file;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--config=")) {
            config_file = arg.substr(9);
        } else if (!is_log_option(arg)) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return 1;
        }
    }

    auto settings = load_config(config_file);
    if (!settings) {
        return 1;
    }

    loader::ClassHierarchyLoader class_loader(settings->profile.member_policy);
    auto loaded = class_loader.load_directory(input);
    if (loaded.class_files.empty()) {
        TPLID_LOG_ERROR("stats", "No readable class files in " << input.string());
        return 1;
    }

    std::cout << loader::format_cha_stats(loader::compute_cha_stats(loaded.class_files));
    if (!loaded.errors.empty()) {
        std::cout << "  unreadable files: " << loaded.errors.size() << "\n";
    }

    auto tree = model::PackageTree::build(std::move(loaded.classes));
    if (is_err(tree)) {
        TPLID_LOG_ERROR("stats", model::error_message(unwrap_err(tree)));
        return 1;
    }

    const auto& package_tree = unwrap(tree);
    std::cout << "= Package Tree =\n";
    std::cout << "  packages: " << package_tree.node_count() << "\n";
    std::cout << "  classes after policy: " << package_tree.class_count() << "\n";
    if (package_tree.has_multiple_roots()) {
        std::cout << "  roots (multiple):";
    } else {
        std::cout << "  root:";
    }
    for (auto root : package_tree.root_nodes()) {
        std::cout << " " << join_path(package_tree.path_of(root));
    }
    std::cout << "\n";
    return 0;
}

} // namespace tplid::cli
