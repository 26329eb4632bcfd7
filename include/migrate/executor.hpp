//! # Rewrite Executor
//!
//! Applies a Plan to the files under the content root.
//!
//! Each file is read whole, patched in memory from the highest offset down,
//! and written back only if something changed. Before every patch the
//! original text is compared at its offset; a mismatch means the file
//! changed after scanning, so the edit is skipped and reported as a
//! `WriteConflict` while the file's other edits still go through.

#ifndef DOCLINK_MIGRATE_EXECUTOR_HPP
#define DOCLINK_MIGRATE_EXECUTOR_HPP

#include "migrate/issue.hpp"
#include "migrate/planner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace doclink::migrate {

struct ExecutionReport {
    size_t files_modified = 0;
    size_t edits_applied = 0;
    size_t conflicts = 0;
    std::vector<Issue> issues;
};

class RewriteExecutor {
public:
    explicit RewriteExecutor(std::filesystem::path root) : root_(std::move(root)) {}

    ExecutionReport apply(const Plan& plan) const;

    /// Patches `content` in place. Returns the number of edits applied;
    /// conflicts are appended to `report`.
    static size_t patch(std::string& content, const std::vector<RewriteEdit>& edits,
                        ExecutionReport& report);

private:
    std::filesystem::path root_;

    void apply_file(const std::string& file, const std::vector<RewriteEdit>& edits,
                    ExecutionReport& report) const;
};

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_EXECUTOR_HPP
