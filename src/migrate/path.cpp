#include "migrate/path.hpp"

namespace doclink::migrate::path {

std::vector<std::string_view> components(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos)
            slash = path.size();
        if (slash > pos)
            parts.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return parts;
}

static std::string assemble(const std::vector<std::string_view>& parts, size_t first = 0) {
    std::string out;
    for (size_t i = first; i < parts.size(); ++i) {
        if (!out.empty())
            out += '/';
        out += parts[i];
    }
    return out;
}

std::optional<std::string> normalize(std::string_view path) {
    std::vector<std::string_view> stack;
    for (auto part : components(path)) {
        if (part == ".")
            continue;
        if (part == "..") {
            if (stack.empty())
                return std::nullopt;
            stack.pop_back();
            continue;
        }
        stack.push_back(part);
    }
    return assemble(stack);
}

std::string parent_dir(std::string_view path) {
    size_t slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return {};
    return std::string(path.substr(0, slash));
}

std::string_view file_name(std::string_view path) {
    size_t slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string join(std::string_view dir, std::string_view rel) {
    if (dir.empty())
        return std::string(rel);
    std::string out(dir);
    if (out.back() != '/')
        out += '/';
    out += rel;
    return out;
}

std::string relative(std::string_view from_dir, std::string_view to_path) {
    auto from = components(from_dir);
    auto to = components(to_path);

    // The last component of to_path is the file name; it never counts as shared.
    size_t common = 0;
    while (common < from.size() && common + 1 < to.size() && from[common] == to[common]) {
        ++common;
    }

    std::string out;
    for (size_t i = common; i < from.size(); ++i) {
        out += "../";
    }
    out += assemble(to, common);
    return out;
}

std::pair<std::string_view, std::string_view> split_anchor(std::string_view target) {
    size_t hash = target.find('#');
    if (hash == std::string_view::npos)
        return {target, std::string_view{}};
    return {target.substr(0, hash), target.substr(hash)};
}

bool is_markdown(std::string_view path) {
    return path.size() > 3 && path.ends_with(".md");
}

std::string to_forward_slashes(std::string_view path) {
    std::string result(path);
    for (char& c : result) {
        if (c == '\\')
            c = '/';
    }
    return result;
}

} // namespace doclink::migrate::path
