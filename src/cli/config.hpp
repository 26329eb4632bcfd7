//! # Command Options and Configuration
//!
//! Options shared by `migrate` and `check`, filled first from
//! `doclink.toml` and then from the command line.
//!
//! ## Configuration Section
//!
//! ```toml
//! [migrate]
//! root = "docs/enforce/policy-as-code/template-library"
//! move-table = "migration/template-library.moves"
//! nav = "mkdocs.yml"
//! verify = "mkdocs build --strict"
//! exclude = "drafts,archive"
//! check = true
//! format = "text"
//! ```

#pragma once

#include "common.hpp"
#include "migrate/issue.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace doclink::cli {

struct MigrateOptions {
    std::string root;                     ///< Content root directory
    std::string move_table;               ///< Manifest path
    std::string nav;                      ///< Navigation file to audit (optional)
    std::string verify;                   ///< Strict build command (optional)
    std::vector<std::string> exclude;     ///< Directory names skipped by the scanner
    bool dry_run = false;                 ///< Plan only
    bool check = false;                   ///< Link pre-check after rewriting
    bool help = false;                    ///< --help was given
    OutputFormat format = OutputFormat::Text;
};

/// Loads `[migrate]` defaults from `doclink.toml` in `project_root`.
/// A missing file yields default options.
MigrateOptions load_config(const std::filesystem::path& project_root);

/// Parses command arguments starting at `argv[first]` on top of `base`.
/// Logging options are skipped; unknown options are configuration errors.
Result<MigrateOptions, migrate::ConfigError> parse_migrate_args(int argc, char* argv[], int first,
                                                                MigrateOptions base);

/// Splits "a,b , c" into {"a", "b", "c"}.
std::vector<std::string> split_list(const std::string& value);

} // namespace doclink::cli
