//! # Migration Issues
//!
//! Per-link and per-file problems accumulated during a run. Issues never
//! abort sibling files; the final report decides the exit code from them.
//!
//! ## Issue Codes
//!
//! | Code | Kind                 | Severity |
//! |------|----------------------|----------|
//! | D001 | `MalformedLink`      | error    |
//! | D002 | `UnresolvableTarget` | error    |
//! | D003 | `WriteConflict`      | error    |
//! | D004 | `BrokenLink`         | error    |
//! | D005 | `WriteFailed`        | error    |
//! | D006 | `ReadFailed`         | error    |
//! | D007 | `AmbiguousLink`      | error    |
//! | D102 | `StaleNavEntry`      | warning  |

#ifndef DOCLINK_MIGRATE_ISSUE_HPP
#define DOCLINK_MIGRATE_ISSUE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace doclink::migrate {

enum class IssueKind {
    MalformedLink,
    UnresolvableTarget,
    WriteConflict,
    BrokenLink,
    WriteFailed,
    ReadFailed,
    AmbiguousLink,
    StaleNavEntry,
};

enum class Severity { Error, Warning };

/// A single problem found while scanning, planning or applying.
struct Issue {
    IssueKind kind;
    std::string file;  ///< Content-root-relative path (or config file path)
    uint32_t line = 0; ///< 1-based, 0 when not tied to a line
    uint32_t column = 0;
    std::string message;
};

/// A fatal configuration problem (missing root, malformed move table).
/// Aborts the run before any file is written.
struct ConfigError {
    std::string message;
    std::string file;  ///< Offending configuration file, if any
    uint32_t line = 0; ///< 1-based line in `file`, 0 when not applicable
};

/// Stable code for an issue kind (e.g. "D002").
inline const char* issue_code(IssueKind kind) {
    switch (kind) {
    case IssueKind::MalformedLink:
        return "D001";
    case IssueKind::UnresolvableTarget:
        return "D002";
    case IssueKind::WriteConflict:
        return "D003";
    case IssueKind::BrokenLink:
        return "D004";
    case IssueKind::WriteFailed:
        return "D005";
    case IssueKind::ReadFailed:
        return "D006";
    case IssueKind::AmbiguousLink:
        return "D007";
    case IssueKind::StaleNavEntry:
        return "D102";
    }
    return "D000";
}

/// Human-readable kind name (e.g. "unresolvable-target").
inline const char* issue_name(IssueKind kind) {
    switch (kind) {
    case IssueKind::MalformedLink:
        return "malformed-link";
    case IssueKind::UnresolvableTarget:
        return "unresolvable-target";
    case IssueKind::WriteConflict:
        return "write-conflict";
    case IssueKind::BrokenLink:
        return "broken-link";
    case IssueKind::WriteFailed:
        return "write-failed";
    case IssueKind::ReadFailed:
        return "read-failed";
    case IssueKind::AmbiguousLink:
        return "ambiguous-link";
    case IssueKind::StaleNavEntry:
        return "stale-nav-entry";
    }
    return "unknown";
}

inline Severity issue_severity(IssueKind kind) {
    switch (kind) {
    case IssueKind::StaleNavEntry:
        return Severity::Warning;
    default:
        return Severity::Error;
    }
}

/// Counts issues of the given severity.
inline size_t count_issues(const std::vector<Issue>& issues, Severity severity) {
    size_t n = 0;
    for (const auto& issue : issues) {
        if (issue_severity(issue.kind) == severity)
            ++n;
    }
    return n;
}

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_ISSUE_HPP
