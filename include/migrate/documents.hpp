//! # Document Set
//!
//! The set of documents a link may legitimately point at. Two flavours:
//!
//! - `on_disk()`: exactly the Markdown files present under the content root
//! - `after_migration()`: files on disk, minus every moved-away path, plus
//!   every move destination. This is valid whether or not the files were
//!   physically relocated before the run.

#ifndef DOCLINK_MIGRATE_DOCUMENTS_HPP
#define DOCLINK_MIGRATE_DOCUMENTS_HPP

#include "migrate/move_table.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace doclink::migrate {

class DocumentSet {
public:
    DocumentSet() = default;

    static DocumentSet on_disk(const std::vector<std::string>& files);

    static DocumentSet after_migration(const std::vector<std::string>& files,
                                       const MoveTable& table);

    bool contains(std::string_view path) const {
        return paths_.find(path) != paths_.end();
    }

    void insert(std::string path) {
        paths_.insert(std::move(path));
    }

    size_t size() const {
        return paths_.size();
    }

private:
    std::set<std::string, std::less<>> paths_;
};

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_DOCUMENTS_HPP
