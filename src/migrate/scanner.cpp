//! # Link Scanner Implementation
//!
//! Line-oriented extraction of Markdown link targets.
//!
//! ```text
//! scan_text()
//!   ├─ fence open/close lines     → toggle code-block state, skip
//!   ├─ inside a fenced block      → skip
//!   ├─ "[label]: target"          → reference definition
//!   └─ otherwise, left to right:
//!        ├─ `code span`           → skip
//!        ├─ ![alt](src)           → skip (image)
//!        └─ [text](target)        → inline link
//! ```

#include "migrate/scanner.hpp"

#include "log/log.hpp"
#include "migrate/file_io.hpp"
#include "migrate/path.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace doclink::migrate {

namespace {

/// Location of a parsed `(destination "title")` group.
struct Destination {
    bool ok = false;
    size_t begin = 0; ///< First byte of the target text
    size_t end = 0;   ///< One past the last byte of the target text
    size_t next = 0;  ///< One past the closing ')'
};

size_t count_run(std::string_view line, size_t pos, char c) {
    size_t n = 0;
    while (pos + n < line.size() && line[pos + n] == c) {
        ++n;
    }
    return n;
}

size_t skip_blanks(std::string_view line, size_t pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

/// Index one past a code span starting at `pos`, or `pos + run` if unclosed.
size_t skip_code_span(std::string_view line, size_t pos) {
    size_t run = count_run(line, pos, '`');
    size_t j = pos + run;
    while ((j = line.find('`', j)) != std::string_view::npos) {
        size_t r = count_run(line, j, '`');
        if (r == run)
            return j + r;
        j += r;
    }
    return pos + run;
}

/// Matching ']' for the '[' at `open`, honoring nesting and escapes.
size_t find_closing_bracket(std::string_view line, size_t open) {
    int depth = 0;
    for (size_t i = open; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\') {
            ++i;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (--depth == 0)
                return i;
        }
    }
    return std::string_view::npos;
}

/// Parses the destination that follows "](" at `pos`.
Destination parse_destination(std::string_view line, size_t pos) {
    Destination dest;
    size_t p = skip_blanks(line, pos);

    if (p < line.size() && line[p] == '<') {
        size_t close = line.find('>', p + 1);
        if (close == std::string_view::npos)
            return dest;
        dest.begin = p + 1;
        dest.end = close;
        p = close + 1;
    } else {
        dest.begin = p;
        int depth = 0;
        while (p < line.size()) {
            char c = line[p];
            if (c == '\\') {
                p += 2;
                continue;
            }
            if (c == ' ' || c == '\t')
                break;
            if (c == '(') {
                ++depth;
            } else if (c == ')') {
                if (depth == 0)
                    break;
                --depth;
            }
            ++p;
        }
        p = std::min(p, line.size());
        dest.end = p;
    }

    p = skip_blanks(line, p);
    if (p < line.size() && (line[p] == '"' || line[p] == '\'' || line[p] == '(')) {
        char closer = line[p] == '(' ? ')' : line[p];
        size_t close = line.find(closer, p + 1);
        if (close == std::string_view::npos)
            return dest;
        p = skip_blanks(line, close + 1);
    }

    if (p < line.size() && line[p] == ')') {
        dest.ok = true;
        dest.next = p + 1;
    }
    return dest;
}

/// Tracks fenced code blocks (``` and ~~~) across lines.
class FenceState {
public:
    /// Returns true if `line` is inside a fence or is a fence delimiter.
    bool consume(std::string_view line) {
        size_t indent = count_run(line, 0, ' ');
        if (indent <= 3 && indent < line.size() && (line[indent] == '`' || line[indent] == '~')) {
            char c = line[indent];
            size_t run = count_run(line, indent, c);
            if (run >= 3) {
                if (fence_char_ == 0) {
                    fence_char_ = c;
                    fence_len_ = run;
                    return true;
                }
                if (c == fence_char_ && run >= fence_len_ &&
                    skip_blanks(line, indent + run) == line.size()) {
                    fence_char_ = 0;
                    return true;
                }
            }
        }
        return fence_char_ != 0;
    }

private:
    char fence_char_ = 0;
    size_t fence_len_ = 0;
};

/// Per-document extraction context.
class LineScanner {
public:
    LineScanner(const std::string& source, std::vector<LinkReference>& links,
                std::vector<Issue>& issues)
        : source_(source), dir_(path::parent_dir(source)), links_(links), issues_(issues) {}

    void scan(std::string_view line, size_t line_offset, uint32_t line_no) {
        line_ = line;
        line_offset_ = line_offset;
        line_no_ = line_no;

        if (scan_reference_definition())
            return;
        scan_inline();
    }

private:
    const std::string& source_;
    std::string dir_;
    std::vector<LinkReference>& links_;
    std::vector<Issue>& issues_;

    std::string_view line_;
    size_t line_offset_ = 0;
    uint32_t line_no_ = 0;

    void record(size_t begin, size_t end, LinkKind kind) {
        std::string_view target = line_.substr(begin, end - begin);
        if (target.empty()) {
            malformed(begin, "link has an empty target");
            return;
        }
        if (!LinkScanner::is_relative_markdown(target))
            return;

        auto [link_path, anchor] = path::split_anchor(target);

        LinkReference ref;
        ref.source = source_;
        ref.target = std::string(target);
        ref.path = std::string(link_path);
        ref.anchor = std::string(anchor);
        ref.offset = line_offset_ + begin;
        ref.line = line_no_;
        ref.column = static_cast<uint32_t>(begin + 1);
        ref.kind = kind;
        ref.resolved = path::normalize(path::join(dir_, link_path));

        DOCLINK_LOG_TRACE("scan", source_ << ":" << ref.line << ":" << ref.column << " -> "
                                          << ref.target);
        links_.push_back(std::move(ref));
    }

    void malformed(size_t column, const std::string& message) {
        Issue issue;
        issue.kind = IssueKind::MalformedLink;
        issue.file = source_;
        issue.line = line_no_;
        issue.column = static_cast<uint32_t>(column + 1);
        issue.message = message;
        issues_.push_back(std::move(issue));
    }

    /// "[label]: target" with at most three spaces of indentation.
    bool scan_reference_definition() {
        size_t p = count_run(line_, 0, ' ');
        if (p > 3 || p >= line_.size() || line_[p] != '[')
            return false;

        size_t close = line_.find(']', p + 1);
        if (close == std::string_view::npos || close == p + 1 || line_[p + 1] == '^')
            return false;
        if (close + 1 >= line_.size() || line_[close + 1] != ':')
            return false;

        size_t begin = skip_blanks(line_, close + 2);
        if (begin >= line_.size())
            return false;

        size_t end;
        if (line_[begin] == '<') {
            end = line_.find('>', begin + 1);
            if (end == std::string_view::npos)
                return false;
            ++begin;
        } else {
            end = begin;
            while (end < line_.size() && line_[end] != ' ' && line_[end] != '\t') {
                ++end;
            }
        }

        record(begin, end, LinkKind::Reference);
        return true;
    }

    void scan_inline() {
        size_t i = 0;
        while (i < line_.size()) {
            char c = line_[i];
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == '`') {
                i = skip_code_span(line_, i);
                continue;
            }
            if (c != '[') {
                ++i;
                continue;
            }

            bool image = i > 0 && line_[i - 1] == '!';
            size_t close = find_closing_bracket(line_, i);
            if (close == std::string_view::npos || close + 1 >= line_.size() ||
                line_[close + 1] != '(') {
                ++i;
                continue;
            }

            Destination dest = parse_destination(line_, close + 2);
            if (!dest.ok) {
                if (!image && line_.find(".md", close) != std::string_view::npos) {
                    malformed(close + 2, "unterminated link target");
                }
                i = close + 1;
                continue;
            }

            if (!image) {
                record(dest.begin, dest.end, LinkKind::Inline);
            }
            i = dest.next;
        }
    }
};

} // namespace

// ============================================================================
// LinkScanner
// ============================================================================

LinkScanner::LinkScanner(fs::path root, ScanOptions options)
    : root_(std::move(root)), options_(std::move(options)) {}

bool LinkScanner::is_relative_markdown(std::string_view target) {
    if (target.empty() || target.front() == '/' || target.front() == '#')
        return false;

    // "http:", "mailto:" and friends: a colon before any path separator
    size_t colon = target.find(':');
    size_t separator = target.find_first_of("/#");
    if (colon != std::string_view::npos && (separator == std::string_view::npos || colon < separator))
        return false;

    return path::is_markdown(path::split_anchor(target).first);
}

bool LinkScanner::is_excluded(const fs::path& dir) const {
    std::string name = dir.filename().string();
    if (name.size() > 1 && name[0] == '.' && name != "..")
        return true;
    return std::find(options_.exclude_dirs.begin(), options_.exclude_dirs.end(), name) !=
           options_.exclude_dirs.end();
}

std::vector<std::string> LinkScanner::list_files(std::vector<Issue>& issues) const {
    std::vector<std::string> files;
    try {
        if (!fs::is_directory(root_))
            return files;

        for (auto it = fs::recursive_directory_iterator(root_);
             it != fs::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;
            if (entry.is_directory()) {
                if (is_excluded(entry.path()))
                    it.disable_recursion_pending();
                continue;
            }
            if (entry.is_regular_file() && entry.path().extension() == ".md") {
                files.push_back(entry.path().lexically_relative(root_).generic_string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        DOCLINK_LOG_ERROR("scan", "Cannot walk " << root_ << ": " << e.what());
        std::string where = e.path1().empty() ? root_.generic_string()
                                              : e.path1().lexically_relative(root_).generic_string();
        issues.push_back(
            Issue{IssueKind::ReadFailed, where, 0, 0, std::string("cannot list: ") + e.what()});
    }

    std::sort(files.begin(), files.end());
    return files;
}

void LinkScanner::for_each_file(const std::vector<std::string>& files, const FileVisitor& visitor,
                                std::vector<Issue>& issues) const {
    for (const auto& file : files) {
        std::string content;
        try {
            content = read_file(root_ / file);
        } catch (const std::exception& e) {
            DOCLINK_LOG_ERROR("scan", e.what());
            issues.push_back(Issue{IssueKind::ReadFailed, file, 0, 0, e.what()});
            continue;
        }
        visitor(file, content);
    }
}

void LinkScanner::for_each_file(const FileVisitor& visitor, std::vector<Issue>& issues) const {
    for_each_file(list_files(issues), visitor, issues);
}

void LinkScanner::scan_text(const std::string& source, std::string_view content,
                            std::vector<LinkReference>& links, std::vector<Issue>& issues) {
    FenceState fences;
    LineScanner scanner(source, links, issues);

    size_t line_start = 0;
    uint32_t line_no = 0;
    while (line_start < content.size()) {
        size_t newline = content.find('\n', line_start);
        size_t line_end = newline == std::string_view::npos ? content.size() : newline;

        std::string_view line = content.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        ++line_no;

        if (!fences.consume(line)) {
            scanner.scan(line, line_start, line_no);
        }

        if (newline == std::string_view::npos)
            break;
        line_start = newline + 1;
    }
}

ScanResult LinkScanner::scan() const {
    ScanResult result;
    result.files = list_files(result.issues);

    for_each_file(
        result.files,
        [&](const std::string& file, const std::string& content) {
            scan_text(file, content, result.links, result.issues);
        },
        result.issues);

    DOCLINK_LOG_INFO("scan", "Scanned " << result.files.size() << " files, found "
                                        << result.links.size() << " relative links");
    return result;
}

} // namespace doclink::migrate
