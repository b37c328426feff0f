//! # tplid Entry Point
//!
//! The `main()` function only delegates to the CLI driver
//! (`cli/driver.hpp`), which parses arguments, sets up logging and
//! dispatches to the subcommands.
//!
//! ```bash
//! tplid profile <class-dir>          # Fingerprint a library version
//! tplid match <app-dir> --profiles=  # Identify libraries in an application
//! tplid dump <profile.lib>           # Print a stored profile
//! tplid stats <class-dir>            # Class hierarchy statistics
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return tplid_main(argc, argv);
}
