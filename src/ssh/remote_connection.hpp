#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "tunnel.hpp"

namespace fs = std::filesystem;

// One connection to one remote host. Disconnected until connect() succeeds;
// every remote operation before that fails with ErrorKind::NotConnected.
// Implementations are internally synchronized; no operation retries.
class RemoteConnection {
public:
    virtual ~RemoteConnection() = default;

    // Transport + handshake + authentication. Idempotent once connected.
    virtual Result<void> connect(Deadline deadline) = 0;

    // Run a command and capture combined stdout+stderr. Deadline expiry is
    // reported as RemoteResult::timed_out, not as an error.
    virtual Result<RemoteResult> execute(const std::string& command, Deadline deadline) = 0;

    virtual Result<void> upload_file(const fs::path& local, const std::string& remote,
                                     Deadline deadline) = 0;
    virtual Result<void> download_file(const std::string& remote, const fs::path& local,
                                       Deadline deadline) = 0;

    virtual Result<std::shared_ptr<TunnelHandle>> create_tunnel(int local_port,
                                                                const std::string& remote_host,
                                                                int remote_port) = 0;

    // Runs a round trip, not a cached flag.
    virtual bool is_connected() = 0;

    virtual void close() = 0;
};

// Creates a disconnected connection for a server. Injected into the Registry.
using ConnectionFactory =
    std::function<std::shared_ptr<RemoteConnection>(const ServerConfig&)>;
