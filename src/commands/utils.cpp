#include "polyp/utils.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <chrono>
#include <ctime>

#include <openssl/evp.h>

std::string read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to get size of file: " + filename);
    }

    file.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !file.read(&buffer[0], size)) {
        throw std::runtime_error("Failed to read file: " + filename);
    }
    return buffer;
}

void write_file(const std::string& filename, const std::string& data) {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write data to file: " + filename);
    }
}

bool file_exists(const std::string& filename) {
    std::error_code ec;
    return fs::exists(filename, ec);
}

void ensure_directory_exists(const fs::path& dir_path) {
    if (!fs::exists(dir_path)) {
        try {
            fs::create_directories(dir_path);
        } catch (const fs::filesystem_error& e) {
            throw std::runtime_error("Failed to create directory " + dir_path.string() + ": " + e.what());
        }
    } else if (!fs::is_directory(dir_path)) {
        throw std::runtime_error("Path exists but is not a directory: " + dir_path.string());
    }
}

void ensure_parent_directory_exists(const fs::path& file_path) {
    fs::path parent_dir = file_path.parent_path();
    if (!parent_dir.empty()) {
        ensure_directory_exists(parent_dir);
    }
}

void write_file_atomic(const std::string& filename, const std::string& data) {
    ensure_parent_directory_exists(filename);
    std::string lock_path = filename + ".lock";
    try {
        write_file(lock_path, data);
        fs::rename(lock_path, filename);
    } catch (...) {
        std::error_code ec;
        fs::remove(lock_path, ec);
        throw;
    }
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) return "";
    // 4 output bytes per 3 input bytes, plus the terminating NUL EVP_EncodeBlock writes.
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("base64 encoding failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    if (encoded.empty()) return std::string();
    if (encoded.size() % 4 != 0) return std::nullopt;
    for (size_t i = 0; i < encoded.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if (std::isalnum(c) || c == '+' || c == '/') continue;
        // Padding only in the last two positions.
        if (c == '=' && i + 2 >= encoded.size()) continue;
        return std::nullopt;
    }
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    if (padding == 1 && encoded[encoded.size() - 2] == '=') return std::nullopt;
    if (padding == 0 && encoded.find('=') != std::string::npos) return std::nullopt;

    std::string out(3 * (encoded.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string get_current_timestamp_utc() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc_tm{};
    gmtime_r(&now_c, &utc_tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc_tm);
    return buffer;
}

std::vector<std::string> split_string(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

// Non-empty lines with surrounding whitespace removed.
std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    for (const std::string& line : split_string(s, '\n')) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string short_sha(const std::string& sha, size_t length) {
    return sha.substr(0, length);
}
