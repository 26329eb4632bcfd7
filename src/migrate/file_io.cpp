#include "migrate/file_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace doclink::migrate {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }
    out << content;
    out.flush();
    if (!out) {
        throw std::runtime_error("Write failed: " + path.string());
    }
}

} // namespace doclink::migrate
