//! # Match Command Interface
//!
//! `tplid match <app-dir>...` identifies profiled libraries in one or more
//! applications.

#pragma once

namespace tplid::cli {

int run_match(int argc, char* argv[]);

} // namespace tplid::cli
