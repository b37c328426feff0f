//! # Log Initialization from CLI
//!
//! Turns the logging flags shared by every `tplid` command, and the TPLID_LOG
//! environment variable, into a LogConfig. Explicit levels beat `-v`
//! counts, and either beats the environment.

#include "tplid/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

namespace tplid::log {

namespace {

std::optional<std::string_view> option_value(std::string_view arg, std::string_view prefix) {
    if (!arg.starts_with(prefix))
        return std::nullopt;
    return arg.substr(prefix.size());
}

/// Counts the `v`s of -v, -vv or -vvv; zero for anything else.
int verbosity_of(std::string_view arg) {
    if (arg == "--verbose")
        return 1;
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos)
        return 0;
    return static_cast<int>(arg.size() - 1);
}

LogLevel level_for_verbosity(int count) {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto v = option_value(arg, "--log-level=")) {
            explicit_level = parse_level(*v);
        } else if (auto v = option_value(arg, "--log-filter=")) {
            config.filter_spec = std::string(*v);
        } else if (auto v = option_value(arg, "--log-file=")) {
            config.log_file = std::string(*v);
        } else if (auto v = option_value(arg, "--log-format=")) {
            config.format = (*v == "json" || *v == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else {
            verbosity = std::max(verbosity, verbosity_of(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
        return config;
    }
    if (verbosity > 0) {
        config.level = level_for_verbosity(verbosity);
        return config;
    }
    if (!config.filter_spec.empty())
        return config;

    const char* env = std::getenv("TPLID_LOG");
    std::string_view env_value = env ? env : "";
    if (env_value.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = std::string(env_value);
    } else if (!env_value.empty()) {
        config.level = parse_level(env_value);
    }

    return config;
}

} // namespace tplid::log
