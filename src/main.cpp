//! # migrate-links Entry Point
//!
//! Delegates to the CLI driver, which handles argument parsing, logging
//! setup, command dispatch and exit codes.
//!
//! ## Usage
//!
//! ```bash
//! migrate-links --root docs --move-table moves.txt --dry-run
//! migrate-links --root docs --move-table moves.txt --verify "mkdocs build --strict"
//! migrate-links check --root docs
//! ```
//!
//! ## See Also
//!
//! - `cli/dispatcher.cpp` - Command dispatching logic
//! - `migrate/pipeline.hpp` - Scan, plan and apply

#include "cli/driver.hpp"

/// @return 0 on success, 1 when links could not be fixed, 2 on fatal errors
int main(int argc, char* argv[]) {
    return doclink_main(argc, argv);
}
