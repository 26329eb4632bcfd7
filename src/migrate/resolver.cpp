#include "migrate/resolver.hpp"

#include "migrate/path.hpp"

namespace doclink::migrate {

Result<std::string, ResolveError> resolve(std::string_view target, std::string_view source_old_dir,
                                          std::string_view source_new_dir, const MoveTable& table,
                                          const DocumentSet& documents) {
    auto [link_path, anchor] = path::split_anchor(target);
    if (link_path.empty()) {
        return ResolveError{IssueKind::MalformedLink, "link has an empty target path"};
    }

    auto absolute = path::normalize(path::join(source_old_dir, link_path));
    if (!absolute || absolute->empty()) {
        return ResolveError{IssueKind::UnresolvableTarget,
                            "'" + std::string(link_path) + "' climbs above the content root"};
    }

    std::string destination;
    if (auto moved = table.lookup(*absolute)) {
        destination = *moved;
    } else if (documents.contains(*absolute)) {
        destination = *absolute;
    } else {
        return ResolveError{IssueKind::UnresolvableTarget,
                            "'" + std::string(link_path) + "' points at '" + *absolute +
                                "', which is neither moved nor present in the tree"};
    }

    std::string rewritten = path::relative(source_new_dir, destination);
    rewritten += anchor;
    return rewritten;
}

} // namespace doclink::migrate
