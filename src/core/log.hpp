#pragma once

#include <string>
#include <core/types.hpp>

// Debug trace log. Lines are appended to a file, timestamped to the millisecond.
// Default path is <tmp>/fleet_debug.log; an empty path disables logging.
void set_fleet_log_path(const std::string& path);

void fleet_log(const std::string& msg);

// Log a remote command and its result (output truncated).
void fleet_log_remote(const std::string& label, const RemoteResult& r);
