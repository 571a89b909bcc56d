#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

class RemoteManager;

// ── Standard metric commands ────────────────────────────────
// Each prints a single value (or /proc line) parsed by the matching function below.
constexpr const char* LOADAVG_COMMAND   = "cat /proc/loadavg";
constexpr const char* CPU_IDLE_COMMAND  =
    "top -bn1 | grep 'Cpu(s)' | sed 's/.*, *\\([0-9.]*\\)%* id.*/\\1/'";
constexpr const char* MEMORY_COMMAND    = "free | grep Mem | awk '{printf \"%.1f\", $3/$2 * 100.0}'";
constexpr const char* DISK_COMMAND      = "df / | tail -1 | awk '{print $5}' | cut -d'%' -f1";
constexpr const char* PROCESS_COMMAND   = "ps aux | wc -l";
constexpr const char* UPTIME_COMMAND    = "cat /proc/uptime";

// ── Parsers ─────────────────────────────────────────────────
// All parsers are total: malformed input yields nullopt, never an exception.

// First three fields of /proc/loadavg.
std::optional<std::vector<double>> parse_load_average(const std::string& output);

// First field of /proc/uptime, truncated to whole seconds.
std::optional<std::chrono::seconds> parse_uptime(const std::string& output);

// CPU usage percent from the idle percent printed by top.
std::optional<double> parse_cpu_usage(const std::string& idle_output);

// A bare number, optionally followed by '%'.
std::optional<double> parse_percentage(const std::string& output);

std::optional<int> parse_count(const std::string& output);

// Merge every "METRIC:key=value" line into metrics. Numeric values go to
// custom_metrics, anything else to custom_labels. Returns the number merged.
int parse_custom_metrics(const std::string& output, ServerMetrics& metrics);

// Run the standard metric commands against one server and fill in what parses.
// Commands that fail or print garbage leave the field untouched.
void collect_system_metrics(RemoteManager& remote, const std::string& server,
                            Deadline deadline, ServerMetrics& metrics);
