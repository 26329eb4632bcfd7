//! # Move Table Loader
//!
//! Parses the line-based migration manifest into a MoveTable and enforces
//! the table invariants. Any violation is a fatal configuration error.

#include "migrate/move_table.hpp"

#include "log/log.hpp"
#include "migrate/file_io.hpp"
#include "migrate/path.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace doclink::migrate {

// ============================================================================
// Helpers
// ============================================================================

static ConfigError make_error(std::string message) {
    ConfigError error;
    error.message = std::move(message);
    return error;
}

/// Strips a trailing "# comment" and splits the rest on whitespace.
static std::vector<std::string> tokenize(const std::string& line) {
    std::string body = line;
    size_t hash = body.find('#');
    while (hash != std::string::npos) {
        if (hash == 0 || body[hash - 1] == ' ' || body[hash - 1] == '\t') {
            body.erase(hash);
            break;
        }
        hash = body.find('#', hash + 1);
    }

    std::vector<std::string> tokens;
    std::istringstream in(body);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

/// Validates and canonicalizes one manifest path.
static Result<std::string, ConfigError> canonical(std::string_view raw) {
    std::string forward = path::to_forward_slashes(raw);
    if (!forward.empty() && forward.front() == '/') {
        return make_error("path '" + forward + "' must be relative to the content root");
    }
    auto normalized = path::normalize(forward);
    if (!normalized || normalized->empty()) {
        return make_error("path '" + forward + "' escapes the content root");
    }
    if (!path::is_markdown(*normalized)) {
        return make_error("path '" + forward + "' is not a Markdown document");
    }
    return *normalized;
}

// ============================================================================
// MoveTable
// ============================================================================

std::optional<ConfigError> MoveTable::add(std::string_view old_path, std::string_view new_path) {
    auto old_result = canonical(old_path);
    if (is_err(old_result))
        return unwrap_err(old_result);
    auto new_result = canonical(new_path);
    if (is_err(new_result))
        return unwrap_err(new_result);

    const std::string& from = unwrap(old_result);
    const std::string& to = unwrap(new_result);

    if (from == to) {
        DOCLINK_LOG_DEBUG("table", "Dropping identity entry " << from);
        return std::nullopt;
    }
    if (forward_.find(from) != forward_.end()) {
        return make_error("'" + from + "' is moved twice");
    }
    if (reverse_.find(to) != reverse_.end()) {
        return make_error("'" + to + "' is the destination of two moves");
    }
    if (forward_.find(to) != forward_.end() || reverse_.find(from) != reverse_.end()) {
        return make_error("move '" + from + " -> " + to +
                          "' chains with another entry; a path cannot be both moved and a "
                          "destination");
    }

    forward_.emplace(from, to);
    reverse_.emplace(to, from);
    return std::nullopt;
}

std::optional<ConfigError> MoveTable::add_nested(const fs::path& content_root, std::string_view dir,
                                                 std::string_view prefix) {
    auto normalized = path::normalize(path::to_forward_slashes(dir));
    if (!normalized || normalized->empty()) {
        return make_error("nest directory '" + std::string(dir) + "' is not inside the content root");
    }
    const std::string& nested = *normalized;

    fs::path full = content_root / nested;
    std::vector<std::string> names;
    try {
        if (!fs::is_directory(full)) {
            return make_error("nest directory '" + nested + "' does not exist under " +
                              content_root.string());
        }
        for (const auto& entry : fs::directory_iterator(full)) {
            if (!entry.is_regular_file())
                continue;
            std::string name = entry.path().filename().string();
            if (!path::is_markdown(name) || name == "index.md" || name == "README.md")
                continue;
            names.push_back(std::move(name));
        }
    } catch (const fs::filesystem_error& e) {
        return make_error("cannot list nest directory '" + nested + "': " + e.what());
    }

    std::sort(names.begin(), names.end());

    std::string old_prefix =
        prefix.empty() ? std::string(path::file_name(nested)) + "-" : std::string(prefix);
    std::string parent = path::parent_dir(nested);

    for (const auto& name : names) {
        std::string from = path::join(parent, old_prefix + name);
        std::string to = path::join(nested, name);
        if (auto error = add(from, to))
            return error;
    }

    DOCLINK_LOG_DEBUG("table", "nest " << nested << ": " << names.size() << " entries");
    return std::nullopt;
}

std::optional<std::string> MoveTable::lookup(std::string_view old_path) const {
    auto it = forward_.find(old_path);
    if (it == forward_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> MoveTable::reverse_lookup(std::string_view new_path) const {
    auto it = reverse_.find(new_path);
    if (it == reverse_.end())
        return std::nullopt;
    return it->second;
}

// ============================================================================
// Manifest Parsing
// ============================================================================

Result<MoveTable, ConfigError> MoveTable::parse(std::string_view text, const fs::path& content_root,
                                                std::string_view origin) {
    MoveTable table;
    std::istringstream in{std::string(text)};
    std::string line;
    uint32_t line_no = 0;

    auto located = [&](ConfigError error) {
        error.file = std::string(origin);
        error.line = line_no;
        return error;
    };

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        auto tokens = tokenize(line);
        if (tokens.empty())
            continue;

        std::optional<ConfigError> error;
        if (tokens[0] == "nest") {
            if (tokens.size() == 2) {
                error = table.add_nested(content_root, tokens[1]);
            } else if (tokens.size() == 3) {
                error = table.add_nested(content_root, tokens[1], tokens[2]);
            } else {
                return located(make_error("expected 'nest <dir> [prefix]'"));
            }
        } else if (tokens.size() == 3 && tokens[1] == "->") {
            error = table.add(tokens[0], tokens[2]);
        } else if (tokens.size() == 2) {
            error = table.add(tokens[0], tokens[1]);
        } else {
            return located(make_error("expected '<old> -> <new>' but found '" + line + "'"));
        }

        if (error)
            return located(std::move(*error));
    }

    DOCLINK_LOG_INFO("table", "Loaded " << table.size() << " moves from " << origin);
    return table;
}

Result<MoveTable, ConfigError> MoveTable::load(const fs::path& manifest,
                                               const fs::path& content_root) {
    std::string text;
    try {
        text = read_file(manifest);
    } catch (const std::exception& e) {
        ConfigError error;
        error.message = e.what();
        error.file = manifest.string();
        return error;
    }
    return parse(text, content_root, manifest.string());
}

} // namespace doclink::migrate
