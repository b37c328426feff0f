#include "utils.hpp"

#include "tplid/common.hpp"
#include "tplid/log/log.hpp"

#include <cstdlib>
#include <iostream>

namespace tplid::cli {

bool is_log_option(const std::string& arg) {
    if (arg.starts_with("--log-") || arg == "-q" || arg == "--quiet" || arg == "--verbose")
        return true;
    return arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
           arg.find_first_not_of('v', 1) == std::string::npos;
}

std::optional<double> parse_score(const std::string& text) {
    if (text.empty())
        return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    // NaN fails both comparisons
    if (end != text.c_str() + text.size() || !(value >= 0.0 && value <= 1.0))
        return std::nullopt;
    return value;
}

std::optional<int> parse_count(const std::string& text) {
    if (text.empty())
        return std::nullopt;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || value < 0 || value > 1024)
        return std::nullopt;
    return static_cast<int>(value);
}

std::optional<config::TplidConfig> load_config(const std::string& path) {
    auto result = path.empty() ? config::TplidConfig::load_from_current_dir()
                               : config::TplidConfig::load(path);
    if (is_err(result)) {
        TPLID_LOG_ERROR("config", "Invalid configuration: " << unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

void print_usage() {
    std::cout << "tplid " << VERSION << " - third-party library identification\n\n";
    std::cout << "Usage: tplid <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  profile   Fingerprint a library and store its profile\n";
    std::cout << "  match     Identify libraries in applications\n";
    std::cout << "  dump      Print a stored profile\n";
    std::cout << "  stats     Print class hierarchy statistics\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
    std::cout << "  --config=<file>       Use this tplid.toml instead of ./tplid.toml\n";
    std::cout << "  -v, -vv, -vvv         Info, debug or trace logging\n";
    std::cout << "  -q, --quiet           Errors only\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. match=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also write log records to a file\n";
    std::cout << "  --log-format=json     One JSON object per log line\n";
}

void print_version() {
    std::cout << "tplid " << VERSION << "\n";
}

} // namespace tplid::cli
