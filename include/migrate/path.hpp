//! # Content Path Algebra
//!
//! Pure POSIX-style path helpers over content-root-relative paths. No I/O.
//!
//! All paths handled here use `/` separators, carry no leading slash and are
//! interpreted relative to the content root. The root directory itself is
//! the empty string.
//!
//! | Function        | Example                                        |
//! |-----------------|------------------------------------------------|
//! | `normalize()`   | `a/./b/../c.md` → `a/c.md`                     |
//! | `parent_dir()`  | `topic/a.md` → `topic`, `a.md` → ``            |
//! | `join()`        | (`topic`, `../b.md`) → `topic/../b.md`         |
//! | `relative()`    | (`topic1`, `topic2/b.md`) → `../topic2/b.md`   |
//! | `split_anchor()`| `a.md#intro` → (`a.md`, `#intro`)              |

#ifndef DOCLINK_MIGRATE_PATH_HPP
#define DOCLINK_MIGRATE_PATH_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace doclink::migrate::path {

/// Splits a path into its non-empty components.
std::vector<std::string_view> components(std::string_view path);

/// Collapses `.`, `..` and repeated separators.
///
/// Returns `std::nullopt` when the path climbs above the content root.
/// A leading `/` is ignored.
std::optional<std::string> normalize(std::string_view path);

/// Directory part of a path; empty for files at the content root.
std::string parent_dir(std::string_view path);

/// Final component of a path.
std::string_view file_name(std::string_view path);

/// Joins a directory and a relative path without normalizing.
std::string join(std::string_view dir, std::string_view rel);

/// Relative path leading from directory `from_dir` to file `to_path`.
///
/// Both arguments must be normalized. Shared leading components are dropped,
/// one `../` is emitted per remaining `from_dir` component, then the rest of
/// `to_path` follows. A file in `from_dir` itself yields its bare name.
std::string relative(std::string_view from_dir, std::string_view to_path);

/// Splits a link target into path and anchor (anchor keeps its `#`).
std::pair<std::string_view, std::string_view> split_anchor(std::string_view target);

/// True if the path names a Markdown document (`.md` suffix).
bool is_markdown(std::string_view path);

/// Converts platform separators to `/`.
std::string to_forward_slashes(std::string_view path);

} // namespace doclink::migrate::path

#endif // DOCLINK_MIGRATE_PATH_HPP
