//! # sidl-traits Driver
//!
//! `sidl_main()` is the whole command-line tool; `main()` only forwards to it.

#pragma once

/// Runs `sidl-traits` and returns the process exit code.
int sidl_main(int argc, char* argv[]);
