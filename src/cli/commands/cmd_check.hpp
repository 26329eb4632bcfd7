//! # Check Command
//!
//! `migrate-links check --root <dir>` scans the tree and reports every
//! relative `.md` link whose target does not exist. This is the fast
//! pre-check to run before the site generator's strict build.

#ifndef DOCLINK_CLI_CMD_CHECK_HPP
#define DOCLINK_CLI_CMD_CHECK_HPP

namespace doclink::cli {

/// Runs the check command; options start at `argv[first]`.
/// Returns 0 when every link resolves, 1 otherwise, 2 on fatal errors.
int run_check(int argc, char* argv[], int first);

} // namespace doclink::cli

#endif // DOCLINK_CLI_CMD_CHECK_HPP
