#include "migrate/planner.hpp"

#include "log/log.hpp"
#include "migrate/path.hpp"
#include "migrate/resolver.hpp"

#include <algorithm>

namespace doclink::migrate {

static Issue issue_at(const LinkReference& link, IssueKind kind, std::string message) {
    Issue issue;
    issue.kind = kind;
    issue.file = link.source;
    issue.line = link.line;
    issue.column = link.column;
    issue.message = std::move(message);
    return issue;
}

SourceLocation RewritePlanner::locate(const std::string& source) const {
    SourceLocation loc;
    if (auto destination = table_.lookup(source)) {
        // File not physically moved yet
        loc.old_dir = path::parent_dir(source);
        loc.new_dir = path::parent_dir(*destination);
    } else if (auto origin = table_.reverse_lookup(source)) {
        loc.old_dir = path::parent_dir(*origin);
        loc.new_dir = path::parent_dir(source);
    } else {
        loc.old_dir = path::parent_dir(source);
        loc.new_dir = loc.old_dir;
    }
    return loc;
}

LinkDecision RewritePlanner::plan_link(const LinkReference& link) const {
    LinkDecision decision;
    SourceLocation loc = locate(link.source);

    auto current = path::normalize(path::join(loc.new_dir, link.path));
    bool current_ok = current && !current->empty() && documents_.contains(*current);

    auto resolved = resolve(link.target, loc.old_dir, loc.new_dir, table_, documents_);

    if (current_ok) {
        if (loc.old_dir != loc.new_dir && is_ok(resolved)) {
            auto stale_path = path::split_anchor(unwrap(resolved)).first;
            auto stale = path::normalize(path::join(loc.new_dir, stale_path));
            if (stale && *stale != *current) {
                decision.issue = issue_at(link, IssueKind::AmbiguousLink,
                                          "'" + link.target + "' is valid from the new location ('" +
                                              *current + "') but pointed at '" + *stale +
                                              "' before the move; left unchanged, fix by hand");
            }
        }
        return decision;
    }

    if (is_err(resolved)) {
        const auto& error = unwrap_err(resolved);
        decision.issue = issue_at(link, error.kind, error.message);
        return decision;
    }

    if (unwrap(resolved) != link.target) {
        decision.replacement = unwrap(resolved);
    }
    return decision;
}

Plan RewritePlanner::plan(const std::vector<LinkReference>& links) const {
    Plan result;

    for (const auto& link : links) {
        ++result.links_examined;
        LinkDecision decision = plan_link(link);

        if (decision.issue) {
            result.issues.push_back(std::move(*decision.issue));
        }
        if (!decision.replacement)
            continue;

        DOCLINK_LOG_DEBUG("plan", link.source << ":" << link.line << ": " << link.target << " -> "
                                              << *decision.replacement);

        RewriteEdit edit;
        edit.file = link.source;
        edit.offset = link.offset;
        edit.original = link.target;
        edit.replacement = std::move(*decision.replacement);
        edit.line = link.line;
        edit.column = link.column;
        result.edits[link.source].push_back(std::move(edit));
    }

    for (auto& [_, list] : result.edits) {
        std::sort(list.begin(), list.end(), [](const RewriteEdit& a, const RewriteEdit& b) {
            return a.offset > b.offset;
        });
    }

    DOCLINK_LOG_INFO("plan", "Planned " << result.edit_count() << " edits in "
                                        << result.edits.size() << " files from "
                                        << result.links_examined << " links");
    return result;
}

} // namespace doclink::migrate
