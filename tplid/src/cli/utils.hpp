//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function            | Description                              |
//! |---------------------|------------------------------------------|
//! | `is_log_option()`   | Argument consumed by the logger          |
//! | `parse_score()`     | Parse a value in [0, 1]                  |
//! | `load_config()`     | tplid.toml from a path or the cwd        |
//! | `print_usage()`     | Print CLI help text                      |
//! | `print_version()`   | Print tool version                       |

#pragma once

#include "tplid/config/config.hpp"

#include <optional>
#include <string>

namespace tplid::cli {

// Argument helpers
bool is_log_option(const std::string& arg);
std::optional<double> parse_score(const std::string& text);
std::optional<int> parse_count(const std::string& text);

/// Loads `path`, or tplid.toml from the current directory when `path` is
/// empty. Errors are logged.
std::optional<config::TplidConfig> load_config(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace tplid::cli
