//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the tplid CLI.
//! It initializes logging, then routes to the appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! tplid_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ profile        → run_profile()
//!   ├─ match          → run_match()
//!   ├─ dump           → run_dump()
//!   └─ stats          → run_stats()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`-v`, `-q`, `--log-*`) are accepted by every command and
//! consumed here before dispatch.

#include "cli/driver.hpp"
#include "cli/commands/cmd_inspect.hpp"
#include "cli/commands/cmd_match.hpp"
#include "cli/commands/cmd_profile.hpp"
#include "cli/utils.hpp"
#include "tplid/log/log.hpp"

#include <iostream>
#include <string>

namespace tplid::cli {

/// Main entry point for the tplid CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Usage error, unreadable input, failed artifact |
///
/// ## Examples
///
/// ```bash
/// tplid profile build/okhttp --profiles-dir=profiles
/// tplid match build/app --profiles=profiles --format=json
/// tplid dump profiles/Utilities/OkHttp_3.12.0.lib --signatures
/// ```
int tplid_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    int status = 1;
    if (command == "profile") {
        status = run_profile(argc, argv);
    } else if (command == "match") {
        status = run_match(argc, argv);
    } else if (command == "dump") {
        status = run_dump(argc, argv);
    } else if (command == "stats") {
        status = run_stats(argc, argv);
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        std::cerr << "Run 'tplid --help' for usage information.\n";
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace tplid::cli

// Entry point wrapper (outside namespace)
int tplid_main(int argc, char* argv[]) {
    return tplid::cli::tplid_main(argc, argv);
}
