#include "migrate/checker.hpp"

#include "log/log.hpp"
#include "migrate/path.hpp"

namespace doclink::migrate {

namespace {

std::optional<std::string> target_of(const LinkReference& link, const MoveTable* table) {
    if (table) {
        if (auto dest = table->lookup(link.source))
            return path::normalize(path::join(path::parent_dir(*dest), link.path));
    }
    return link.resolved;
}

std::vector<Issue> check(const std::vector<LinkReference>& links, const DocumentSet& documents,
                         const MoveTable* table) {
    std::vector<Issue> issues;
    for (const auto& link : links) {
        auto target = target_of(link, table);
        std::string message;
        if (!target || target->empty()) {
            message = "'" + link.target + "' climbs above the content root";
        } else if (!documents.contains(*target)) {
            message = "'" + link.target + "' points at missing document '" + *target + "'";
        } else {
            continue;
        }

        Issue issue;
        issue.kind = IssueKind::BrokenLink;
        issue.file = link.source;
        issue.line = link.line;
        issue.column = link.column;
        issue.message = std::move(message);
        issues.push_back(std::move(issue));
    }

    DOCLINK_LOG_INFO("check", "Checked " << links.size() << " links, " << issues.size()
                                         << " broken");
    return issues;
}

} // namespace

std::vector<Issue> check_links(const std::vector<LinkReference>& links,
                               const DocumentSet& documents) {
    return check(links, documents, nullptr);
}

std::vector<Issue> check_links(const std::vector<LinkReference>& links,
                               const DocumentSet& documents, const MoveTable& table) {
    return check(links, documents, &table);
}

} // namespace doclink::migrate
