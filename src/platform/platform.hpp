#pragma once

#include <string>
#include <filesystem>
#include <fstream>

namespace platform {

// Returns $HOME, or the temp directory when it is unset.
std::filesystem::path home_dir();

// Returns the system temporary directory ($TMPDIR, falling back to /tmp).
std::filesystem::path temp_dir();

// Returns a fresh path in the temp directory named <prefix>_<pid>_<n>.
// Nothing is created on disk.
std::filesystem::path temp_file(const std::string& prefix);

// Create or truncate path as a mode 0600 file, then open `out` on it.
// The mode is set before `out` sees the file, so nothing written is ever
// readable by others. False if the file cannot be created or restricted.
bool open_owner_only(const std::filesystem::path& path, std::ofstream& out);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
