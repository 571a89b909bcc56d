#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <chrono>
#include <cstdint>

// Error categories carried by Result<T>
enum class ErrorKind {
    None,
    Validation,        // bad input, rejected before any I/O
    NotFound,          // unknown server / cluster / profile / task / alert
    NotConnected,      // remote operation without a successful connect
    Authentication,
    Network,
    Timeout,
    ChecksumMismatch,
    CommandFailed,     // remote command ran but exited non-zero
    State,             // operation not allowed in the current state
    Io,                // local filesystem failure
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::Validation:       return "validation";
        case ErrorKind::NotFound:         return "not_found";
        case ErrorKind::NotConnected:     return "not_connected";
        case ErrorKind::Authentication:   return "authentication";
        case ErrorKind::Network:          return "network";
        case ErrorKind::Timeout:          return "timeout";
        case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case ErrorKind::CommandFailed:    return "command_failed";
        case ErrorKind::State:            return "state";
        case ErrorKind::Io:               return "io";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap an error from another Result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;
using Timestamp = std::chrono::system_clock::time_point;

inline Deadline deadline_in(std::chrono::milliseconds timeout) {
    return Clock::now() + timeout;
}

// Remote command execution result
struct RemoteResult {
    std::string server_name;
    std::string command;
    std::string output;       // combined stdout + stderr
    std::string error;
    int exit_code = -1;
    std::chrono::milliseconds duration{0};
    Timestamp timestamp{};
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }
};

// ── Server directory ────────────────────────────────────────

struct ServerConfig {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    std::string key_path;                 // takes precedence over password
    std::vector<std::string> tags;
    int timeout_secs = 0;                 // connect timeout, 0 = configured default

    bool uses_key() const { return !key_path.empty(); }
};

enum class ServerStatus { Unknown, Online, Offline };

inline const char* server_status_name(ServerStatus status) {
    switch (status) {
        case ServerStatus::Online:  return "online";
        case ServerStatus::Offline: return "offline";
        default:                    return "unknown";
    }
}

struct ServerRecord {
    ServerConfig config;
    ServerStatus status = ServerStatus::Unknown;
    Timestamp last_checked{};
    std::string last_error;
};

enum class HealthLevel { Unknown, Healthy, Warning, Critical };

inline const char* health_level_name(HealthLevel level) {
    switch (level) {
        case HealthLevel::Healthy:  return "healthy";
        case HealthLevel::Warning:  return "warning";
        case HealthLevel::Critical: return "critical";
        default:                    return "unknown";
    }
}

struct HealthStatus {
    std::string server_name;
    HealthLevel level = HealthLevel::Unknown;
    std::string message;
    std::chrono::milliseconds response_time{0};
    Timestamp checked_at{};
};

// Latest metric snapshot for one server. Overwritten on every collection.
struct ServerMetrics {
    std::string server_name;
    Timestamp last_update{};
    ServerStatus status = ServerStatus::Unknown;
    std::chrono::milliseconds response_time{0};
    std::chrono::seconds uptime{0};
    std::vector<double> load_average;     // 1, 5, 15 minute
    double cpu_usage = 0.0;               // percent
    double memory_usage = 0.0;            // percent
    double disk_usage = 0.0;              // percent
    int process_count = 0;
    std::map<std::string, double> custom_metrics;
    std::map<std::string, std::string> custom_labels;   // non-numeric METRIC: values
};

