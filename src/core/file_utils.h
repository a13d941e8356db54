#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace imgopt::core {

bool file_exists(const std::filesystem::path& path);

bool ensure_directory(const std::filesystem::path& dir, std::string& error);

// Writes to a sibling temporary file and renames it over path, so readers never
// observe a partially written file.
bool write_file_atomic(const std::filesystem::path& path,
                       const std::vector<unsigned char>& bytes,
                       std::string& error);
bool write_file_atomic(const std::filesystem::path& path, const std::string& text, std::string& error);

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error);

bool copy_file_atomic(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);

bool last_write_ticks(const std::filesystem::path& path, long long& out);

std::uintmax_t file_size_or_zero(const std::filesystem::path& path);

// Supported images under root, as sorted POSIX-style relative paths. Paths
// that are not valid UTF-8 go to rejected instead, when given.
bool discover_images(const std::filesystem::path& root,
                     std::vector<std::string>& out,
                     std::string& error,
                     std::vector<std::string>* rejected = nullptr);

std::string to_relative_posix(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace imgopt::core
