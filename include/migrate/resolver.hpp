//! # Path Resolver
//!
//! Computes the corrected text of a relative link. Pure: consults only the
//! in-memory MoveTable and DocumentSet.
//!
//! ## Algorithm
//!
//! ```text
//! resolve("b.md#x", old_dir="", new_dir="topic1")
//!   ├─ abs = normalize(old_dir / "b.md")      → "b.md"
//!   ├─ moved? table["b.md"]                   → "topic2/b.md"
//!   ├─ relative(new_dir, "topic2/b.md")       → "../topic2/b.md"
//!   └─ re-attach anchor                       → "../topic2/b.md#x"
//! ```
//!
//! A target that is neither moved nor a known document is an
//! `UnresolvableTarget`; the resolver never produces a dangling link.

#ifndef DOCLINK_MIGRATE_RESOLVER_HPP
#define DOCLINK_MIGRATE_RESOLVER_HPP

#include "common.hpp"
#include "migrate/documents.hpp"
#include "migrate/issue.hpp"
#include "migrate/move_table.hpp"

#include <string>
#include <string_view>

namespace doclink::migrate {

struct ResolveError {
    IssueKind kind;
    std::string message;
};

/// Rewrites `target` (path plus optional `#anchor`, relative to the
/// referencing file's old directory) so that it is correct relative to the
/// referencing file's new directory.
Result<std::string, ResolveError> resolve(std::string_view target, std::string_view source_old_dir,
                                          std::string_view source_new_dir, const MoveTable& table,
                                          const DocumentSet& documents);

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_RESOLVER_HPP
