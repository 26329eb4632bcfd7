#include "migrate/documents.hpp"

namespace doclink::migrate {

DocumentSet DocumentSet::on_disk(const std::vector<std::string>& files) {
    DocumentSet set;
    for (const auto& file : files) {
        set.insert(file);
    }
    return set;
}

DocumentSet DocumentSet::after_migration(const std::vector<std::string>& files,
                                         const MoveTable& table) {
    DocumentSet set;
    for (const auto& file : files) {
        if (!table.is_moved(file))
            set.insert(file);
    }
    for (const auto& [_, destination] : table.entries()) {
        set.insert(destination);
    }
    return set;
}

} // namespace doclink::migrate
