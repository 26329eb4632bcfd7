//! # Migrate Command
//!
//! Implements `migrate-links migrate`, the default command.
//!
//! ## Usage
//!
//! ```bash
//! migrate-links --root docs --move-table moves.txt
//! migrate-links migrate --root docs --move-table moves.txt --dry-run
//! migrate-links --root docs --move-table moves.txt --nav mkdocs.yml \
//!     --verify "mkdocs build --strict"
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                              |
//! |------|------------------------------------------------------|
//! | 0    | All links rewritten or already correct               |
//! | 1    | Link/file errors, conflicts, or verification failed  |
//! | 2    | Fatal configuration error, nothing was written       |

#ifndef DOCLINK_CLI_CMD_MIGRATE_HPP
#define DOCLINK_CLI_CMD_MIGRATE_HPP

namespace doclink::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ISSUES = 1;
constexpr int EXIT_FATAL = 2;

/// Runs the migrate command; options start at `argv[first]`.
int run_migrate(int argc, char* argv[], int first);

/// Prints help for the migrate command.
void print_migrate_help();

} // namespace doclink::cli

#endif // DOCLINK_CLI_CMD_MIGRATE_HPP
