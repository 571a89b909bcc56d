#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <filesystem>
#include "types.hpp"

// Compact local timestamp for file names: YYYYmmdd_HHMMSS
std::string file_timestamp(Timestamp t);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Single-quote a string for a POSIX shell.
std::string shell_quote(const std::string& s);

// MD5 hex digest of a byte string.
std::string md5_hex(const std::string& data);

// MD5 hex digest of a file's contents. Empty string if unreadable.
std::string compute_file_md5(const std::filesystem::path& path);

// Extract the first 32-char hex MD5 hash from noisy command output.
std::string parse_md5_from_output(const std::string& output);

// Split text into lines, dropping trailing '\r'.
std::vector<std::string> split_lines(const std::string& text);

// Milliseconds remaining until deadline (0 if already passed).
long long remaining_ms(Deadline deadline);
