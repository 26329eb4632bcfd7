#include "migrate/executor.hpp"

#include "log/log.hpp"
#include "migrate/file_io.hpp"

namespace doclink::migrate {

size_t RewriteExecutor::patch(std::string& content, const std::vector<RewriteEdit>& edits,
                              ExecutionReport& report) {
    size_t applied = 0;
    for (const auto& edit : edits) {
        bool matches = edit.offset <= content.size() &&
                       content.compare(edit.offset, edit.original.size(), edit.original) == 0;
        if (!matches) {
            Issue issue;
            issue.kind = IssueKind::WriteConflict;
            issue.file = edit.file;
            issue.line = edit.line;
            issue.column = edit.column;
            issue.message = "expected '" + edit.original + "' at byte " +
                            std::to_string(edit.offset) + "; file changed since scanning";
            report.issues.push_back(std::move(issue));
            ++report.conflicts;
            continue;
        }
        content.replace(edit.offset, edit.original.size(), edit.replacement);
        ++applied;
    }
    return applied;
}

void RewriteExecutor::apply_file(const std::string& file, const std::vector<RewriteEdit>& edits,
                                 ExecutionReport& report) const {
    auto full = root_ / file;

    std::string content;
    try {
        content = read_file(full);
    } catch (const std::exception& e) {
        report.issues.push_back(Issue{IssueKind::WriteFailed, file, 0, 0, e.what()});
        return;
    }

    std::string patched = content;
    size_t applied = patch(patched, edits, report);
    if (applied == 0 || patched == content)
        return;

    try {
        write_file(full, patched);
    } catch (const std::exception& e) {
        report.issues.push_back(Issue{IssueKind::WriteFailed, file, 0, 0, e.what()});
        return;
    }

    report.edits_applied += applied;
    ++report.files_modified;
    DOCLINK_LOG_INFO("apply", "Rewrote " << applied << " links in " << file);
}

ExecutionReport RewriteExecutor::apply(const Plan& plan) const {
    ExecutionReport report;
    for (const auto& [file, edits] : plan.edits) {
        apply_file(file, edits, report);
    }
    DOCLINK_LOG_INFO("apply", "Applied " << report.edits_applied << " edits to "
                                         << report.files_modified << " files, "
                                         << report.conflicts << " conflicts");
    return report;
}

} // namespace doclink::migrate
