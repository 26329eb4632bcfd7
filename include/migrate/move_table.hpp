//! # Move Table
//!
//! Maps the old content-root-relative path of every relocated document to
//! its new path. Built once per run from a manifest and read-only afterwards.
//!
//! ## Invariants
//!
//! - Keys and values are normalized `.md` paths inside the content root
//! - Keys are unique, values are unique
//! - No path is both a key and a value
//! - Identity entries (`a.md -> a.md`) are dropped
//!
//! ## Manifest Format
//!
//! ```text
//! # comment
//! kyverno-image-security.md -> kyverno-image/security.md
//! opa-rbac-roles.md opa-rbac/roles.md
//! nest kyverno-network                 # kyverno-network-<name>.md -> kyverno-network/<name>.md
//! nest opa-image opa-image-legacy-     # explicit old-name prefix
//! ```

#ifndef DOCLINK_MIGRATE_MOVE_TABLE_HPP
#define DOCLINK_MIGRATE_MOVE_TABLE_HPP

#include "common.hpp"
#include "migrate/issue.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace doclink::migrate {

class MoveTable {
public:
    using Entries = std::map<std::string, std::string, std::less<>>;

    MoveTable() = default;

    /// Loads a manifest file. `content_root` is consulted by `nest` directives.
    static Result<MoveTable, ConfigError> load(const std::filesystem::path& manifest,
                                               const std::filesystem::path& content_root);

    /// Parses manifest text. `origin` names the source in error messages.
    static Result<MoveTable, ConfigError> parse(std::string_view text,
                                                const std::filesystem::path& content_root,
                                                std::string_view origin = "<manifest>");

    /// Adds one relocation. Returns an error if it would break an invariant.
    std::optional<ConfigError> add(std::string_view old_path, std::string_view new_path);

    /// Adds the entries of a `nest <dir> [prefix]` directive: every document
    /// directly inside `<content_root>/<dir>` is taken to have been
    /// `<parent>/<prefix><name>.md` before the move. The default prefix is
    /// `<dir name>-`. `index.md` and `README.md` are skipped.
    std::optional<ConfigError> add_nested(const std::filesystem::path& content_root,
                                          std::string_view dir, std::string_view prefix = {});

    /// New path of a moved document.
    std::optional<std::string> lookup(std::string_view old_path) const;

    /// Old path of a document that now lives at `new_path`.
    std::optional<std::string> reverse_lookup(std::string_view new_path) const;

    bool is_moved(std::string_view old_path) const {
        return forward_.find(old_path) != forward_.end();
    }

    bool is_destination(std::string_view new_path) const {
        return reverse_.find(new_path) != reverse_.end();
    }

    const Entries& entries() const {
        return forward_;
    }

    size_t size() const {
        return forward_.size();
    }

    bool empty() const {
        return forward_.empty();
    }

private:
    Entries forward_;
    Entries reverse_;
};

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_MOVE_TABLE_HPP
