#include "migrate/pipeline.hpp"

#include "log/log.hpp"
#include "migrate/checker.hpp"
#include "migrate/documents.hpp"
#include "migrate/executor.hpp"

#include <iterator>

namespace doclink::migrate {

static void append(std::vector<Issue>& to, std::vector<Issue>&& from) {
    to.insert(to.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
}

MigrationReport run_migration(const MoveTable& table, const MigrationOptions& options) {
    MigrationReport report;
    report.dry_run = options.dry_run;

    LinkScanner scanner(options.root, options.scan);
    ScanResult scan = scanner.scan();
    report.files_scanned = scan.files_scanned();
    report.links_found = scan.links.size();
    append(report.issues, std::move(scan.issues));

    DocumentSet documents = DocumentSet::after_migration(scan.files, table);
    RewritePlanner planner(table, documents);
    Plan plan = planner.plan(scan.links);

    report.edits_planned = plan.edit_count();
    for (const auto& issue : plan.issues) {
        if (issue.kind == IssueKind::UnresolvableTarget)
            ++report.unresolved;
    }
    append(report.issues, std::move(plan.issues));

    for (const auto& [_, edits] : plan.edits) {
        report.proposed.insert(report.proposed.end(), edits.begin(), edits.end());
    }

    if (options.dry_run) {
        DOCLINK_LOG_INFO("cli", "Dry run: " << report.edits_planned << " edits not applied");
        return report;
    }

    RewriteExecutor executor(options.root);
    ExecutionReport applied = executor.apply(plan);
    report.files_modified = applied.files_modified;
    report.edits_applied = applied.edits_applied;
    report.conflicts = applied.conflicts;
    append(report.issues, std::move(applied.issues));

    if (options.check_after) {
        ScanResult rescan = scanner.scan();
        append(report.issues,
               check_links(rescan.links, DocumentSet::after_migration(rescan.files, table), table));
    }

    return report;
}

MigrationReport run_check(const MigrationOptions& options) {
    MigrationReport report;
    report.dry_run = true;

    LinkScanner scanner(options.root, options.scan);
    ScanResult scan = scanner.scan();
    report.files_scanned = scan.files_scanned();
    report.links_found = scan.links.size();
    append(report.issues, std::move(scan.issues));
    append(report.issues, check_links(scan.links, DocumentSet::on_disk(scan.files)));
    return report;
}

} // namespace doclink::migrate
