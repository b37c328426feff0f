//! # Command-Line Driver Interface
//!
//! This header defines the main entry point for the tplid tool.
//!
//! ## Entry Point
//!
//! `tplid_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

// Main driver entry point
// Dispatches to appropriate command handlers
int tplid_main(int argc, char* argv[]);
