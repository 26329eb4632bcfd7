//! # Link Pre-check
//!
//! Fast, approximate stand-in for the site generator's strict build: every
//! scanned relative link must land on a Markdown file that exists on disk.
//!
//! After a migration the tree may still be waiting for its physical moves.
//! The table-aware overload then judges each link from where its source will
//! live, against the post-migration Document Set.

#ifndef DOCLINK_MIGRATE_CHECKER_HPP
#define DOCLINK_MIGRATE_CHECKER_HPP

#include "migrate/documents.hpp"
#include "migrate/issue.hpp"
#include "migrate/move_table.hpp"
#include "migrate/scanner.hpp"

#include <vector>

namespace doclink::migrate {

/// Returns one `BrokenLink` issue per link whose target is missing.
std::vector<Issue> check_links(const std::vector<LinkReference>& links,
                               const DocumentSet& documents);

/// Same check, with links of not-yet-moved sources read from their
/// destination directory.
std::vector<Issue> check_links(const std::vector<LinkReference>& links,
                               const DocumentSet& documents, const MoveTable& table);

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_CHECKER_HPP
