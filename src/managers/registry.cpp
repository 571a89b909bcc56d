#include "registry.hpp"
#include "metrics.hpp"
#include <core/constants.hpp>
#include <core/fan_out.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

Registry::Registry(ConnectionFactory factory, int connect_timeout_secs, int command_timeout_secs)
    : factory_(std::move(factory)),
      connect_timeout_secs_(connect_timeout_secs > 0 ? connect_timeout_secs : CONNECT_TIMEOUT_SECS),
      command_timeout_secs_(command_timeout_secs > 0 ? command_timeout_secs : COMMAND_TIMEOUT_SECS) {}

Registry::~Registry() {
    close_all();
}

// ── Directory ─────────────────────────────────────────────

Result<void> Registry::validate_config(const ServerConfig& config) {
    if (config.name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Server name cannot be empty");
    }
    if (config.name == "." || config.name == ".." ||
        config.name.find_first_of("/\\ \t\r\n") != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation,
            "Server name must not contain whitespace or path separators: " + config.name);
    }
    if (config.host.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Host cannot be empty for " + config.name);
    }
    if (config.port < 1 || config.port > 65535) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("Invalid port {} for {}", config.port, config.name));
    }
    if (config.username.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Username cannot be empty for " + config.name);
    }
    if (config.password.empty() && config.key_path.empty()) {
        return Result<void>::Err(ErrorKind::Validation,
            "Either a password or a private key path is required for " + config.name);
    }
    if (config.timeout_secs < 0) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("Invalid timeout {} for {}", config.timeout_secs, config.name));
    }
    return Result<void>::Ok();
}

Result<void> Registry::add_server(const ServerConfig& config) {
    auto valid = validate_config(config);
    if (valid.is_err()) return valid;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (servers_.count(config.name)) {
        return Result<void>::Err(ErrorKind::Validation,
            "Server '" + config.name + "' already exists");
    }

    Entry entry;
    entry.record.config = config;
    servers_.emplace(config.name, std::move(entry));
    fleet_log(fmt::format("registry: added {} ({}@{}:{})", config.name,
                          config.username, config.host, config.port));
    return Result<void>::Ok();
}

Result<void> Registry::remove_server(const std::string& name) {
    std::shared_ptr<RemoteConnection> conn;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return Result<void>::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
        }
        conn = std::move(it->second.conn);
        servers_.erase(it);
    }

    if (conn) conn->close();
    fleet_log("registry: removed " + name);
    return Result<void>::Ok();
}

Result<void> Registry::update_server(const std::string& name, const ServerConfig& config) {
    if (config.name != name) {
        return Result<void>::Err(ErrorKind::Validation,
            "Server name cannot be changed ('" + name + "' -> '" + config.name + "')");
    }
    auto valid = validate_config(config);
    if (valid.is_err()) return valid;

    std::shared_ptr<RemoteConnection> conn;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return Result<void>::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
        }
        auto& entry = it->second;
        entry.record.config = config;
        entry.record.status = ServerStatus::Unknown;
        entry.record.last_error.clear();
        entry.generation++;
        conn = std::move(entry.conn);
    }

    // The old connection was opened with the old config
    if (conn) conn->close();
    fleet_log("registry: updated " + name);
    return Result<void>::Ok();
}

Result<ServerRecord> Registry::get_server(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return Result<ServerRecord>::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
    }
    return Result<ServerRecord>::Ok(it->second.record);
}

std::vector<ServerRecord> Registry::list_servers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ServerRecord> records;
    records.reserve(servers_.size());
    for (const auto& [name, entry] : servers_) {
        records.push_back(entry.record);
    }
    return records;
}

bool Registry::has_server(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return servers_.count(name) > 0;
}

// ── Connections ───────────────────────────────────────────

Deadline Registry::connect_deadline(const ServerConfig& config, Deadline deadline) const {
    int secs = config.timeout_secs > 0 ? config.timeout_secs : connect_timeout_secs_;
    return std::min(deadline, deadline_in(std::chrono::seconds(secs)));
}

Deadline Registry::command_deadline(Deadline deadline) const {
    return std::min(deadline, deadline_in(std::chrono::seconds(command_timeout_secs_)));
}

Result<std::shared_ptr<RemoteConnection>> Registry::acquire(const std::string& name,
                                                            Deadline deadline) {
    using R = Result<std::shared_ptr<RemoteConnection>>;

    std::shared_ptr<std::mutex> connect_mutex;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return R::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
        }
        if (it->second.conn) return R::Ok(it->second.conn);
        connect_mutex = it->second.connect_mutex;
    }

    std::lock_guard<std::mutex> guard(*connect_mutex);

    // Another caller may have connected while we waited
    ServerConfig config;
    uint64_t generation;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return R::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
        }
        if (it->second.conn) return R::Ok(it->second.conn);
        config = it->second.record.config;
        generation = it->second.generation;
    }

    auto conn = factory_(config);
    if (!conn) {
        return R::Err(ErrorKind::Network, "No connection could be created for " + name);
    }

    auto connected = conn->connect(connect_deadline(config, deadline));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = servers_.find(name);
    bool stale = (it == servers_.end() || it->second.generation != generation);

    if (connected.is_err()) {
        if (!stale) {
            auto& record = it->second.record;
            record.status = ServerStatus::Offline;
            record.last_checked = std::chrono::system_clock::now();
            record.last_error = connected.error;
        }
        lock.unlock();
        fleet_log(fmt::format("registry: connect {} failed: {}", name, connected.error));
        return R::Err(connected);
    }

    if (stale) {
        lock.unlock();
        conn->close();
        return R::Err(ErrorKind::State, "Server '" + name + "' changed while connecting");
    }

    it->second.conn = conn;
    return R::Ok(conn);
}

void Registry::record_outcome(const std::string& name,
                              const std::shared_ptr<RemoteConnection>& conn,
                              ErrorKind kind, const std::string& error) {
    bool transport_failure = (kind == ErrorKind::Network || kind == ErrorKind::Timeout ||
                              kind == ErrorKind::NotConnected);
    std::shared_ptr<RemoteConnection> evicted;
    ServerStatus before = ServerStatus::Unknown;
    ServerStatus after = ServerStatus::Unknown;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) return;

        auto& entry = it->second;
        before = entry.record.status;
        entry.record.last_checked = std::chrono::system_clock::now();
        if (kind == ErrorKind::None) {
            entry.record.status = ServerStatus::Online;
            entry.record.last_error.clear();
        } else {
            entry.record.last_error = error;
            if (transport_failure) {
                entry.record.status = ServerStatus::Offline;
                if (entry.conn == conn) evicted = std::move(entry.conn);
            }
        }
        after = entry.record.status;
    }

    if (before != after) {
        fleet_log(fmt::format("registry: {} {} -> {}", name,
                              server_status_name(before), server_status_name(after)));
    }

    if (evicted) {
        fleet_log(fmt::format("registry: evicting connection to {} ({})", name, error));
        evicted->close();
    }
}

// ── Dispatch ──────────────────────────────────────────────

Result<RemoteResult> Registry::execute_command(const std::string& name,
                                               const std::string& command,
                                               Deadline deadline) {
    auto conn = acquire(name, deadline);
    if (conn.is_err()) return Result<RemoteResult>::Err(conn);

    auto result = conn.value->execute(command, command_deadline(deadline));
    record_outcome(name, conn.value, result.kind, result.error);
    if (result.is_ok()) result.value.server_name = name;
    return result;
}

Result<RemoteResult> Registry::execute_script(const std::string& name,
                                              const std::string& script,
                                              Deadline deadline) {
    // Pick a heredoc delimiter that cannot occur in the body
    std::string delim = "FLEET_SCRIPT_EOF";
    while (script.find(delim) != std::string::npos) delim += "_X";

    std::string body = script;
    if (body.empty() || body.back() != '\n') body += '\n';

    std::string command = "bash -s <<'" + delim + "'\n" + body + delim + "\n";
    return execute_command(name, command, deadline);
}

std::map<std::string, RemoteResult> Registry::execute_on_servers(
        const std::vector<std::string>& names,
        const std::string& command,
        Deadline deadline) {
    return fan_out<RemoteResult>(names, [&](const std::string& name) {
        return to_remote_result(name, command, execute_command(name, command, deadline));
    });
}

Result<void> Registry::upload_file(const std::string& name, const fs::path& local,
                                   const std::string& remote, Deadline deadline) {
    auto conn = acquire(name, deadline);
    if (conn.is_err()) return Result<void>::Err(conn);

    auto result = conn.value->upload_file(local, remote, command_deadline(deadline));
    record_outcome(name, conn.value, result.kind, result.error);
    return result;
}

Result<void> Registry::download_file(const std::string& name, const std::string& remote,
                                     const fs::path& local, Deadline deadline) {
    auto conn = acquire(name, deadline);
    if (conn.is_err()) return Result<void>::Err(conn);

    auto result = conn.value->download_file(remote, local, command_deadline(deadline));
    record_outcome(name, conn.value, result.kind, result.error);
    return result;
}

Result<std::shared_ptr<TunnelHandle>> Registry::create_tunnel(const std::string& name,
                                                              int local_port,
                                                              const std::string& remote_host,
                                                              int remote_port) {
    using R = Result<std::shared_ptr<TunnelHandle>>;
    if (local_port < 0 || local_port > 65535) {
        return R::Err(ErrorKind::Validation, fmt::format("Invalid local port {}", local_port));
    }
    if (remote_port < 1 || remote_port > 65535) {
        return R::Err(ErrorKind::Validation, fmt::format("Invalid remote port {}", remote_port));
    }
    if (remote_host.empty()) {
        return R::Err(ErrorKind::Validation, "Remote host cannot be empty");
    }

    auto conn = acquire(name, deadline_in(std::chrono::seconds(connect_timeout_secs_)));
    if (conn.is_err()) return R::Err(conn);

    return conn.value->create_tunnel(local_port, remote_host, remote_port);
}

// ── Single-server views ───────────────────────────────────

Result<HealthStatus> Registry::test_connection(const ServerConfig& config, Deadline deadline) {
    auto valid = validate_config(config);
    if (valid.is_err()) return Result<HealthStatus>::Err(valid);

    auto conn = factory_(config);
    if (!conn) {
        return Result<HealthStatus>::Err(ErrorKind::Network,
            "No connection could be created for " + config.name);
    }

    auto connected = conn->connect(connect_deadline(config, deadline));
    if (connected.is_err()) return Result<HealthStatus>::Err(connected);

    auto reply = conn->execute(PROBE_COMMAND,
        std::min(deadline, deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS))));
    conn->close();

    if (reply.is_err()) return Result<HealthStatus>::Err(reply);
    if (!reply.value.success() || reply.value.output.find(PROBE_EXPECTED) == std::string::npos) {
        return Result<HealthStatus>::Err(ErrorKind::Network,
            fmt::format("Connectivity check on {} failed (exit {}): {}", config.name,
                        reply.value.exit_code, reply.value.output));
    }

    HealthStatus status;
    status.server_name = config.name;
    status.level = HealthLevel::Healthy;
    status.message = "Server is responding";
    status.response_time = reply.value.duration;
    status.checked_at = std::chrono::system_clock::now();
    return Result<HealthStatus>::Ok(status);
}

Result<HealthStatus> Registry::check_server_health(const std::string& name, Deadline deadline) {
    if (!has_server(name)) {
        return Result<HealthStatus>::Err(ErrorKind::NotFound, "Server '" + name + "' not found");
    }

    auto reply = execute_command(name, PROBE_COMMAND,
        std::min(deadline, deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS))));

    HealthStatus status;
    status.server_name = name;
    status.checked_at = std::chrono::system_clock::now();

    if (reply.is_err()) {
        if (reply.kind == ErrorKind::NotFound) return Result<HealthStatus>::Err(reply);
        status.level = HealthLevel::Critical;
        status.message = "Failed to connect to server: " + reply.error;
    } else if (reply.value.timed_out) {
        status.level = HealthLevel::Critical;
        status.message = "Connectivity check timed out";
        status.response_time = reply.value.duration;
    } else if (!reply.value.success() ||
               reply.value.output.find(PROBE_EXPECTED) == std::string::npos) {
        status.level = HealthLevel::Warning;
        status.message = fmt::format("Unexpected connectivity check result (exit {})", reply.value.exit_code);
        status.response_time = reply.value.duration;
    } else {
        status.level = HealthLevel::Healthy;
        status.message = "Server is responding";
        status.response_time = reply.value.duration;
    }
    fleet_log(fmt::format("registry: health {} = {} ({})", name,
                          health_level_name(status.level), status.message));
    return Result<HealthStatus>::Ok(status);
}

Result<ServerMetrics> Registry::get_server_metrics(const std::string& name, Deadline deadline) {
    auto reply = execute_command(name, PROBE_COMMAND,
        std::min(deadline, deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS))));
    if (reply.is_err()) return Result<ServerMetrics>::Err(reply);

    ServerMetrics metrics;
    metrics.server_name = name;
    metrics.status = reply.value.success() ? ServerStatus::Online : ServerStatus::Unknown;
    metrics.response_time = reply.value.duration;

    collect_system_metrics(*this, name, deadline, metrics);
    metrics.last_update = std::chrono::system_clock::now();
    return Result<ServerMetrics>::Ok(metrics);
}

void Registry::close_all() {
    std::vector<std::shared_ptr<RemoteConnection>> conns;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto& [name, entry] : servers_) {
            if (entry.conn) conns.push_back(std::move(entry.conn));
        }
    }
    for (auto& c : conns) c->close();
}
