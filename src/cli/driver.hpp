//! # Driver Interface
//!
//! `doclink_main()` initializes logging and dispatches to the command named
//! by argv[1]; `migrate` is assumed when argv[1] is an option.

#pragma once

int doclink_main(int argc, char* argv[]);
