//! # Link Scanner
//!
//! Walks the content tree and extracts relative Markdown links.
//!
//! ## Recognized Syntax
//!
//! | Form                     | Example                          |
//! |--------------------------|----------------------------------|
//! | Inline link              | `[text](../guide.md#setup)`      |
//! | Inline, angle brackets   | `[text](<guide.md> "Title")`     |
//! | Reference definition     | `[guide]: topic/guide.md`        |
//!
//! Only targets whose path ends in `.md` are kept. Images, absolute URLs
//! (`scheme:`), root links (`/x.md`) and anchor-only links (`#x`) are
//! skipped, as is everything inside fenced code blocks and code spans.
//!
//! ## Walk Order
//!
//! Files are visited in lexicographic order of their root-relative path,
//! so two scans of the same tree yield identical sequences.

#ifndef DOCLINK_MIGRATE_SCANNER_HPP
#define DOCLINK_MIGRATE_SCANNER_HPP

#include "migrate/issue.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace doclink::migrate {

enum class LinkKind {
    Inline,    ///< `[text](target)`
    Reference, ///< `[label]: target`
};

/// One relative link found in a document.
struct LinkReference {
    std::string source; ///< Root-relative path of the file containing the link
    std::string target; ///< Raw target text as written (path plus anchor)
    std::string path;   ///< Target without the anchor
    std::string anchor; ///< `#fragment` or empty
    size_t offset = 0;  ///< Byte offset of `target` in the file
    uint32_t line = 0;  ///< 1-based line
    uint32_t column = 0;
    LinkKind kind = LinkKind::Inline;
    /// Root-relative path the link points at today; empty optional when the
    /// link climbs above the content root.
    std::optional<std::string> resolved;
};

struct ScanOptions {
    /// Directory names skipped anywhere in the tree. Hidden directories
    /// (leading `.`) are always skipped.
    std::vector<std::string> exclude_dirs;
};

struct ScanResult {
    std::vector<std::string> files; ///< Root-relative Markdown files, sorted
    std::vector<LinkReference> links;
    std::vector<Issue> issues;

    size_t files_scanned() const {
        return files.size();
    }
};

class LinkScanner {
public:
    using FileVisitor = std::function<void(const std::string& file, const std::string& content)>;

    explicit LinkScanner(std::filesystem::path root, ScanOptions options = {});

    /// Lists Markdown files under the root, sorted. A walk that fails
    /// part-way adds a `ReadFailed` issue and returns what was listed.
    std::vector<std::string> list_files(std::vector<Issue>& issues) const;

    /// Reads `files` one at a time, in order, and hands them to `visitor`.
    /// An unreadable file adds a `ReadFailed` issue and is skipped.
    void for_each_file(const std::vector<std::string>& files, const FileVisitor& visitor,
                       std::vector<Issue>& issues) const;

    /// Lists the tree, then visits every file.
    void for_each_file(const FileVisitor& visitor, std::vector<Issue>& issues) const;

    /// Full scan of the tree.
    ScanResult scan() const;

    /// Extracts links from one document's content.
    static void scan_text(const std::string& source, std::string_view content,
                          std::vector<LinkReference>& links, std::vector<Issue>& issues);

    /// True for targets the tool is responsible for: relative, `.md`.
    static bool is_relative_markdown(std::string_view target);

    const std::filesystem::path& root() const {
        return root_;
    }

private:
    std::filesystem::path root_;
    ScanOptions options_;

    bool is_excluded(const std::filesystem::path& dir) const;
};

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_SCANNER_HPP
