#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// The remote capabilities the cluster, monitor and sync managers depend on.
// Registry is the only network-backed implementation; tests substitute their own.
class RemoteManager {
public:
    virtual ~RemoteManager() = default;

    virtual bool has_server(const std::string& name) const = 0;

    // Errors are NotFound for unknown servers, or the connect/transport error.
    // A command that ran, whatever its exit code, is Ok.
    virtual Result<RemoteResult> execute_command(const std::string& name,
                                                 const std::string& command,
                                                 Deadline deadline) = 0;

    virtual Result<void> upload_file(const std::string& name, const fs::path& local,
                                     const std::string& remote, Deadline deadline) = 0;

    virtual Result<void> download_file(const std::string& name, const std::string& remote,
                                       const fs::path& local, Deadline deadline) = 0;
};

// Flatten an execute_command outcome into a RemoteResult so fan-out callers
// always hold one result per server.
inline RemoteResult to_remote_result(const std::string& server, const std::string& command,
                                     const Result<RemoteResult>& r) {
    if (r.is_ok()) return r.value;

    RemoteResult failed;
    failed.server_name = server;
    failed.command = command;
    failed.error = r.error;
    failed.exit_code = -1;
    failed.timestamp = std::chrono::system_clock::now();
    failed.timed_out = (r.kind == ErrorKind::Timeout);
    return failed;
}
