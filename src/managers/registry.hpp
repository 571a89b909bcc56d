#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/remote_connection.hpp>
#include "remote_manager.hpp"

// Server directory and command dispatcher. Owns every connection: one cached
// connection per server, opened lazily on first use and evicted after a
// transport failure or a config change.
class Registry : public RemoteManager {
public:
    // Every execute, upload and download is cut off after command_timeout_secs
    // even when the caller's deadline is later.
    explicit Registry(ConnectionFactory factory,
                      int connect_timeout_secs = CONNECT_TIMEOUT_SECS,
                      int command_timeout_secs = COMMAND_TIMEOUT_SECS);
    ~Registry() override;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ── Directory ──────────────────────────────────────────
    Result<void> add_server(const ServerConfig& config);
    Result<void> remove_server(const std::string& name);
    Result<void> update_server(const std::string& name, const ServerConfig& config);
    Result<ServerRecord> get_server(const std::string& name) const;
    std::vector<ServerRecord> list_servers() const;
    bool has_server(const std::string& name) const override;

    // Checks run by add/update/test_connection, before any network activity.
    static Result<void> validate_config(const ServerConfig& config);

    // ── Dispatch ───────────────────────────────────────────
    Result<RemoteResult> execute_command(const std::string& name,
                                         const std::string& command,
                                         Deadline deadline) override;

    // Feed a script body to `bash -s` through a quoted heredoc.
    Result<RemoteResult> execute_script(const std::string& name,
                                        const std::string& script,
                                        Deadline deadline);

    // One RemoteResult per distinct name, failures included.
    std::map<std::string, RemoteResult> execute_on_servers(const std::vector<std::string>& names,
                                                           const std::string& command,
                                                           Deadline deadline);

    Result<void> upload_file(const std::string& name, const fs::path& local,
                             const std::string& remote, Deadline deadline) override;
    Result<void> download_file(const std::string& name, const std::string& remote,
                               const fs::path& local, Deadline deadline) override;

    Result<std::shared_ptr<TunnelHandle>> create_tunnel(const std::string& name,
                                                        int local_port,
                                                        const std::string& remote_host,
                                                        int remote_port);

    // ── Single-server views ────────────────────────────────
    // Throwaway connect, connectivity check, close. Nothing is recorded.
    Result<HealthStatus> test_connection(const ServerConfig& config, Deadline deadline);
    Result<HealthStatus> check_server_health(const std::string& name, Deadline deadline);
    Result<ServerMetrics> get_server_metrics(const std::string& name, Deadline deadline);

    void close_all();

private:
    struct Entry {
        ServerRecord record;
        std::shared_ptr<RemoteConnection> conn;
        uint64_t generation = 0;           // bumped by update_server
        // Serializes lazy connects so concurrent callers share one session
        std::shared_ptr<std::mutex> connect_mutex = std::make_shared<std::mutex>();
    };

    // Cached connection for name, connecting it first if needed.
    Result<std::shared_ptr<RemoteConnection>> acquire(const std::string& name, Deadline deadline);

    // Record the outcome of a remote call. Transport failures evict `conn`.
    void record_outcome(const std::string& name,
                        const std::shared_ptr<RemoteConnection>& conn,
                        ErrorKind kind, const std::string& error);

    Deadline connect_deadline(const ServerConfig& config, Deadline deadline) const;
    Deadline command_deadline(Deadline deadline) const;

    ConnectionFactory factory_;
    int connect_timeout_secs_;
    int command_timeout_secs_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> servers_;
};
