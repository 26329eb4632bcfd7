#include "cli/report.hpp"

#include <iomanip>

namespace doclink::cli {

using migrate::Issue;
using migrate::MigrationReport;
using migrate::RewriteEdit;

static void print_text(const MigrationReport& report, std::ostream& out) {
    if (report.dry_run && !report.proposed.empty()) {
        out << "Proposed edits:\n";
        for (const RewriteEdit& edit : report.proposed) {
            out << "  " << edit.file << ":" << edit.line << ":" << edit.column << "  "
                << edit.original << " -> " << edit.replacement << "\n";
        }
    }

    if (!report.issues.empty()) {
        out << "Issues:\n";
        for (const Issue& issue : report.issues) {
            bool error = migrate::issue_severity(issue.kind) == migrate::Severity::Error;
            out << "  " << issue.file;
            if (issue.line > 0) {
                out << ":" << issue.line;
                if (issue.column > 0)
                    out << ":" << issue.column;
            }
            out << "  " << (error ? "error" : "warning") << "  [" << migrate::issue_code(issue.kind)
                << "] " << issue.message << "\n";
        }
    }

    auto row = [&out](const char* label, size_t value) {
        out << "  " << std::left << std::setw(17) << label << value << "\n";
    };

    out << "Summary" << (report.dry_run ? " (dry run)" : "") << ":\n";
    row("files scanned", report.files_scanned);
    row("links found", report.links_found);
    row("edits planned", report.edits_planned);
    row("edits applied", report.edits_applied);
    row("files modified", report.files_modified);
    row("conflicts", report.conflicts);
    row("unresolved", report.unresolved);
    row("errors", report.errors());
    row("warnings", report.warnings());
}

static void print_json(const MigrationReport& report, std::ostream& out) {
    out << "{\"dry_run\":" << (report.dry_run ? "true" : "false")
        << ",\"files_scanned\":" << report.files_scanned
        << ",\"links_found\":" << report.links_found
        << ",\"edits_planned\":" << report.edits_planned
        << ",\"edits_applied\":" << report.edits_applied
        << ",\"files_modified\":" << report.files_modified
        << ",\"conflicts\":" << report.conflicts << ",\"unresolved\":" << report.unresolved
        << ",\"errors\":" << report.errors() << ",\"warnings\":" << report.warnings();

    out << ",\"edits\":[";
    for (size_t i = 0; i < report.proposed.size(); ++i) {
        const RewriteEdit& edit = report.proposed[i];
        if (i > 0)
            out << ",";
        out << "{\"file\":\"" << json_escape(edit.file) << "\",\"line\":" << edit.line
            << ",\"column\":" << edit.column << ",\"offset\":" << edit.offset << ",\"from\":\""
            << json_escape(edit.original) << "\",\"to\":\"" << json_escape(edit.replacement)
            << "\"}";
    }

    out << "],\"issues\":[";
    for (size_t i = 0; i < report.issues.size(); ++i) {
        const Issue& issue = report.issues[i];
        if (i > 0)
            out << ",";
        bool error = migrate::issue_severity(issue.kind) == migrate::Severity::Error;
        out << "{\"code\":\"" << migrate::issue_code(issue.kind) << "\",\"kind\":\""
            << migrate::issue_name(issue.kind) << "\",\"severity\":\""
            << (error ? "error" : "warning") << "\",\"file\":\"" << json_escape(issue.file)
            << "\",\"line\":" << issue.line << ",\"column\":" << issue.column
            << ",\"message\":\"" << json_escape(issue.message) << "\"}";
    }
    out << "]}\n";
}

void print_report(const MigrationReport& report, OutputFormat format, std::ostream& out) {
    if (format == OutputFormat::JSON) {
        print_json(report, out);
    } else {
        print_text(report, out);
    }
}

} // namespace doclink::cli
