#pragma once

#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT             = 22;
constexpr int CONNECT_TIMEOUT_SECS         = 10;    // TCP connect + handshake + auth
constexpr int COMMAND_TIMEOUT_SECS         = 300;   // Max time for a single remote command
constexpr int PROBE_TIMEOUT_SECS           = 10;    // Connectivity checks (echo)
constexpr int CHANNEL_OPEN_TIMEOUT_SECS    = 30;    // Opening exec / direct-tcpip channels
constexpr int SSH_KEEPALIVE_SECS           = 30;

// ── Monitoring ──────────────────────────────────────────────
constexpr int MONITOR_TICK_SECS            = 10;    // Scheduler wake-up interval
constexpr int DEFAULT_TASK_INTERVAL_SECS   = 60;
constexpr int DEFAULT_TASK_TIMEOUT_SECS    = 30;
constexpr int DEFAULT_CHECK_TIMEOUT_SECS   = 10;
constexpr int MAX_ALERTS                   = 1000;

// ── Sync ────────────────────────────────────────────────────
constexpr int MAX_SYNC_HISTORY             = 1000;
constexpr const char* DEFAULT_REMOTE_TEMP_DIR = "/tmp";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
constexpr int TUNNEL_BUF_SIZE              = 16384;
constexpr int FILE_CHUNK_SIZE              = 65536;

// ── Check commands ──────────────────────────────────────────
constexpr const char* PROBE_COMMAND        = "echo connectivity_test";
constexpr const char* PROBE_EXPECTED       = "connectivity_test";

// ── Metric marker ───────────────────────────────────────────
// Health-check output lines of the form "METRIC:key=value" become custom metrics.
constexpr const char* METRIC_MARKER        = "METRIC:";
