//! # Navigation Auditor
//!
//! Reads the site navigation file (e.g. `mkdocs.yml`) without modifying it
//! and reports entries that still name a moved document's old path.
//!
//! Every whitespace/quote delimited token ending in `.md` is treated as a
//! content-root-relative document path, which covers both nav forms:
//!
//! ```yaml
//! nav:
//!   - Image security: kyverno-image-security.md
//!   - kyverno-image/signing.md
//! ```

#ifndef DOCLINK_MIGRATE_NAV_HPP
#define DOCLINK_MIGRATE_NAV_HPP

#include "common.hpp"
#include "migrate/issue.hpp"
#include "migrate/move_table.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace doclink::migrate {

/// Document paths mentioned on one line of a navigation file.
std::vector<std::string> nav_paths(std::string_view line);

/// `StaleNavEntry` warnings for `text`; `origin` names the file in issues.
std::vector<Issue> audit_nav_text(std::string_view text, const MoveTable& table,
                                  const std::string& origin);

/// Reads and audits a navigation file. An unreadable file is a fatal
/// configuration error.
Result<std::vector<Issue>, ConfigError> audit_nav(const std::filesystem::path& nav_file,
                                                  const MoveTable& table);

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_NAV_HPP
