//! # Profile Command Interface
//!
//! `tplid profile <class-dir>` loads a library's class files, builds its
//! fingerprint and stores it under `<profiles-dir>/<category>/`.

#pragma once

namespace tplid::cli {

int run_profile(int argc, char* argv[]);

} // namespace tplid::cli
