#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include "remote_connection.hpp"
#include "session.hpp"

// RemoteConnection over one libssh2 session. Every operation opens its own
// exec channel, so concurrent commands on one connection are fine.
class SSHConnection : public RemoteConnection {
public:
    explicit SSHConnection(const ServerConfig& config);
    ~SSHConnection() override;

    SSHConnection(const SSHConnection&) = delete;
    SSHConnection& operator=(const SSHConnection&) = delete;

    Result<void> connect(Deadline deadline) override;
    Result<RemoteResult> execute(const std::string& command, Deadline deadline) override;
    Result<void> upload_file(const fs::path& local, const std::string& remote,
                             Deadline deadline) override;
    Result<void> download_file(const std::string& remote, const fs::path& local,
                               Deadline deadline) override;
    Result<std::shared_ptr<TunnelHandle>> create_tunnel(int local_port,
                                                        const std::string& remote_host,
                                                        int remote_port) override;
    bool is_connected() override;
    void close() override;

    // Factory for Registry injection.
    static ConnectionFactory factory();

private:
    // Exec `command` on a fresh channel. stdin is fed from `input` when set;
    // stdout goes to `sink` when set, otherwise into the result output.
    // Caller holds lifecycle_mutex_ shared.
    Result<RemoteResult> run_channel(const std::string& command,
                                     std::istream* input, std::ostream* sink,
                                     Deadline deadline);

    bool connected_locked() const;

    ServerConfig config_;
    std::unique_ptr<SessionManager> session_;

    // connect/close exclusive, every other operation shared
    mutable std::shared_mutex lifecycle_mutex_;

    std::mutex tunnels_mutex_;
    std::vector<std::shared_ptr<TunnelHandle>> tunnels_;
};
