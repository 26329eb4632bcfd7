//! # Rewrite Planner
//!
//! Decides, for every scanned link, whether its text must change.
//!
//! ## Source Locations
//!
//! | Source file is...      | old dir              | new dir             |
//! |------------------------|----------------------|---------------------|
//! | a move table key       | its own dir          | dir of table value  |
//! | a move table value     | dir of reverse entry | its own dir         |
//! | neither                | its own dir          | its own dir         |
//!
//! ## Decision
//!
//! ```text
//! plan_link()
//!   ├─ link already lands on a known document from the new dir → keep
//!   │     (warn if the old-dir reading lands somewhere else)
//!   ├─ resolve() against the old dir fails                       → issue
//!   ├─ resolved text == original                                 → keep
//!   └─ otherwise                                                 → edit
//! ```
//!
//! Edits are anchored at the scanner's byte offset, never at a string
//! match, and sorted by descending offset within each file.

#ifndef DOCLINK_MIGRATE_PLANNER_HPP
#define DOCLINK_MIGRATE_PLANNER_HPP

#include "migrate/documents.hpp"
#include "migrate/issue.hpp"
#include "migrate/move_table.hpp"
#include "migrate/scanner.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace doclink::migrate {

/// One offset-anchored substitution.
struct RewriteEdit {
    std::string file;        ///< Root-relative path of the file to patch
    size_t offset = 0;       ///< Byte offset of `original`
    std::string original;    ///< Exact text expected at `offset`
    std::string replacement; ///< Text to put in its place
    uint32_t line = 0;
    uint32_t column = 0;
};

struct Plan {
    /// Edits per file, each list sorted by descending offset.
    std::map<std::string, std::vector<RewriteEdit>> edits;
    std::vector<Issue> issues;
    size_t links_examined = 0;

    size_t edit_count() const {
        size_t n = 0;
        for (const auto& [_, list] : edits) {
            n += list.size();
        }
        return n;
    }
};

/// Old and new directory of a referencing file.
struct SourceLocation {
    std::string old_dir;
    std::string new_dir;
};

/// Outcome for a single link.
struct LinkDecision {
    std::optional<std::string> replacement; ///< Set when the link must change
    std::optional<Issue> issue;             ///< Error or warning for this link
};

class RewritePlanner {
public:
    RewritePlanner(const MoveTable& table, const DocumentSet& documents)
        : table_(table), documents_(documents) {}

    Plan plan(const std::vector<LinkReference>& links) const;

    LinkDecision plan_link(const LinkReference& link) const;

    SourceLocation locate(const std::string& source) const;

private:
    const MoveTable& table_;
    const DocumentSet& documents_;
};

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_PLANNER_HPP
