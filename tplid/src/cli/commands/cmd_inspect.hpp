//! # Inspection Commands Interface
//!
//! | Function      | Command       | Output                            |
//! |---------------|---------------|-----------------------------------|
//! | `run_dump()`  | `tplid dump`  | Stored profile as text            |
//! | `run_stats()` | `tplid stats` | Class hierarchy and package stats |

#pragma once

namespace tplid::cli {

int run_dump(int argc, char* argv[]);
int run_stats(int argc, char* argv[]);

} // namespace tplid::cli
