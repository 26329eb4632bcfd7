#include "migrate/nav.hpp"

#include "log/log.hpp"
#include "migrate/file_io.hpp"
#include "migrate/path.hpp"

#include <sstream>

namespace doclink::migrate {

std::vector<std::string> nav_paths(std::string_view line) {
    std::vector<std::string> paths;

    // YAML comment
    size_t hash = line.find(" #");
    if (hash != std::string_view::npos)
        line = line.substr(0, hash);

    size_t pos = 0;
    while (pos < line.size()) {
        size_t begin = line.find_first_not_of(" \t\"'", pos);
        if (begin == std::string_view::npos)
            break;
        size_t end = line.find_first_of(" \t\"'", begin);
        if (end == std::string_view::npos)
            end = line.size();
        pos = end;

        std::string_view token = line.substr(begin, end - begin);
        if (token.find("://") != std::string_view::npos)
            continue;
        size_t colon = token.rfind(':');
        if (colon != std::string_view::npos)
            token = token.substr(colon + 1);
        // Flow sequences and mappings: "[a.md, b.md]", "{x: a.md}"
        while (!token.empty() && (token.front() == '[' || token.front() == '{'))
            token.remove_prefix(1);
        while (!token.empty() && (token.back() == ',' || token.back() == ']' || token.back() == '}'))
            token.remove_suffix(1);

        if (!path::is_markdown(token) || token.front() == '/')
            continue;
        if (auto normalized = path::normalize(token)) {
            paths.push_back(std::move(*normalized));
        }
    }
    return paths;
}

std::vector<Issue> audit_nav_text(std::string_view text, const MoveTable& table,
                                  const std::string& origin) {
    std::vector<Issue> issues;
    std::istringstream in{std::string(text)};
    std::string line;
    uint32_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        for (const auto& entry : nav_paths(line)) {
            auto destination = table.lookup(entry);
            if (!destination)
                continue;

            Issue issue;
            issue.kind = IssueKind::StaleNavEntry;
            issue.file = origin;
            issue.line = line_no;
            issue.message = "navigation still references '" + entry + "', now at '" +
                            *destination + "'";
            DOCLINK_LOG_WARN("nav", origin << ":" << line_no << ": " << issue.message);
            issues.push_back(std::move(issue));
        }
    }
    return issues;
}

Result<std::vector<Issue>, ConfigError> audit_nav(const std::filesystem::path& nav_file,
                                                  const MoveTable& table) {
    std::string text;
    try {
        text = read_file(nav_file);
    } catch (const std::exception& e) {
        ConfigError error;
        error.message = e.what();
        error.file = nav_file.string();
        return error;
    }
    return audit_nav_text(text, table, nav_file.string());
}

} // namespace doclink::migrate
