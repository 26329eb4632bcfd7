//! # Migration Pipeline
//!
//! Wires the components together for one run.
//!
//! ```text
//! run_migration()
//!   ├─ LinkScanner::scan()         files + links + malformed links
//!   ├─ DocumentSet::after_migration()
//!   ├─ RewritePlanner::plan()      edits + unresolvable/ambiguous links
//!   ├─ RewriteExecutor::apply()    skipped with dry_run
//!   └─ check_links()               re-scan, only with check_after
//! ```
//!
//! The Move Table and the content root are validated by the caller;
//! everything reported here is per-link or per-file.

#ifndef DOCLINK_MIGRATE_PIPELINE_HPP
#define DOCLINK_MIGRATE_PIPELINE_HPP

#include "migrate/issue.hpp"
#include "migrate/move_table.hpp"
#include "migrate/planner.hpp"
#include "migrate/scanner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace doclink::migrate {

struct MigrationOptions {
    std::filesystem::path root;
    ScanOptions scan;
    bool dry_run = false;
    bool check_after = false;
};

struct MigrationReport {
    size_t files_scanned = 0;
    size_t links_found = 0;
    size_t edits_planned = 0;
    size_t files_modified = 0;
    size_t edits_applied = 0;
    size_t conflicts = 0;
    size_t unresolved = 0;
    bool dry_run = false;
    std::vector<RewriteEdit> proposed; ///< Every planned edit, in plan order
    std::vector<Issue> issues;

    size_t errors() const {
        return count_issues(issues, Severity::Error);
    }

    size_t warnings() const {
        return count_issues(issues, Severity::Warning);
    }
};

/// Scan, plan and (unless dry-run) apply.
MigrationReport run_migration(const MoveTable& table, const MigrationOptions& options);

/// Scan and verify that every relative link lands on an existing file.
MigrationReport run_check(const MigrationOptions& options);

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_PIPELINE_HPP
