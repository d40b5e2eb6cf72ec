#ifndef POLYP_UTILS_H
#define POLYP_UTILS_H

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

std::string read_file(const std::string& filename);
void write_file(const std::string& filename, const std::string& data);
bool file_exists(const std::string& filename);
void ensure_directory_exists(const fs::path& dir_path);
void ensure_parent_directory_exists(const fs::path& file_path);

// Writes through a "<path>.lock" sibling and renames it over the target.
void write_file_atomic(const std::string& filename, const std::string& data);

std::string base64_encode(const std::string& data);
// std::nullopt when the input is not valid base64.
std::optional<std::string> base64_decode(const std::string& encoded);

std::string get_current_timestamp_utc();

std::vector<std::string> split_string(const std::string& s, char delimiter);
std::vector<std::string> split_lines(const std::string& s);
std::string trim(const std::string& s);
std::string short_sha(const std::string& sha, size_t length = 8);

#endif
