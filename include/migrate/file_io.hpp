//! # File I/O Helpers
//!
//! Whole-file reads and writes. Markdown documents are small, so every read
//! and write covers the complete file. Both functions throw
//! `std::runtime_error` on failure; callers turn that into an issue or a
//! configuration error at the I/O boundary.

#ifndef DOCLINK_MIGRATE_FILE_IO_HPP
#define DOCLINK_MIGRATE_FILE_IO_HPP

#include <filesystem>
#include <string>

namespace doclink::migrate {

/// Reads an entire file in binary mode (line endings are preserved).
std::string read_file(const std::filesystem::path& path);

/// Replaces the file's content with `content`.
void write_file(const std::filesystem::path& path, const std::string& content);

} // namespace doclink::migrate

#endif // DOCLINK_MIGRATE_FILE_IO_HPP
