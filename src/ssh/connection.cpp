#include "connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>

SSHConnection::SSHConnection(const ServerConfig& config)
    : config_(config) {}

SSHConnection::~SSHConnection() {
    close();
}

ConnectionFactory SSHConnection::factory() {
    return [](const ServerConfig& config) -> std::shared_ptr<RemoteConnection> {
        return std::make_shared<SSHConnection>(config);
    };
}

bool SSHConnection::connected_locked() const {
    return session_ && session_->is_active();
}

// ── Lifecycle ─────────────────────────────────────────────

Result<void> SSHConnection::connect(Deadline deadline) {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (connected_locked()) return Result<void>::Ok();

    // A dead session from an earlier connect is discarded, never reused
    if (session_) {
        session_->close();
        session_.reset();
    }

    SessionTarget target;
    target.host = config_.host;
    target.port = config_.port;
    target.user = config_.username;
    target.password = config_.password;
    target.key_path = config_.key_path;

    auto session = std::make_unique<SessionManager>(target);
    auto result = session->establish(deadline);
    if (result.is_err()) {
        fleet_log(fmt::format("connection[{}]: connect failed ({}): {}",
                              config_.name, error_kind_name(result.kind), result.error));
        return result;
    }

    session_ = std::move(session);
    return Result<void>::Ok();
}

void SSHConnection::close() {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);

    // Tunnel threads use the session; join them before it goes away
    std::vector<std::shared_ptr<TunnelHandle>> tunnels;
    {
        std::lock_guard<std::mutex> tlock(tunnels_mutex_);
        tunnels.swap(tunnels_);
    }
    for (auto& t : tunnels) t->stop();

    if (session_) {
        session_->close();
        session_.reset();
    }
}

bool SSHConnection::is_connected() {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (!connected_locked()) return false;

    // Catches a dropped socket without waiting out the round trip
    if (!session_->check_alive()) {
        fleet_log(fmt::format("connection[{}]: session to {} is dead", config_.name,
                              session_->get_target()));
        return false;
    }

    auto r = run_channel(PROBE_COMMAND, nullptr, nullptr,
                         deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS)));
    return r.is_ok() && r.value.success() &&
           r.value.output.find(PROBE_EXPECTED) != std::string::npos;
}

// ── Exec ──────────────────────────────────────────────────

Result<RemoteResult> SSHConnection::run_channel(const std::string& command,
                                                std::istream* input, std::ostream* sink,
                                                Deadline deadline) {
    RemoteResult r;
    r.server_name = config_.name;
    r.command = command;
    r.timestamp = std::chrono::system_clock::now();
    auto start = Clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    };

    auto mtx = session_->io_mutex();

    std::string open_error;
    Deadline open_deadline = std::min(deadline,
        deadline_in(std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS)));
    LIBSSH2_CHANNEL* ch = session_->open_exec_channel(open_deadline, open_error);
    if (!ch) {
        ErrorKind kind = Clock::now() >= open_deadline ? ErrorKind::Timeout : ErrorKind::Network;
        return Result<RemoteResult>::Err(kind, fmt::format("{}: {}", config_.name, open_error));
    }

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        session_->release_channel(ch);
        return Result<RemoteResult>::Err(kind, fmt::format("{}: {}", config_.name, msg));
    };

    // Deadline hit: ask the remote process to stop, drop the channel and
    // report the partial output as a timed-out result.
    auto timed_out = [&]() {
#if LIBSSH2_VERSION_NUM >= 0x010b00
        {
            std::lock_guard<std::mutex> lock(*mtx);
            libssh2_channel_signal_ex(ch, "TERM", 4);
        }
#endif
        session_->release_channel(ch);
        r.exit_code = -1;
        r.timed_out = true;
        r.error = fmt::format("Command timed out after {}ms", elapsed().count());
        r.duration = elapsed();
        return Result<RemoteResult>::Ok(r);
    };

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*mtx);
            rc = libssh2_channel_exec(ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) return timed_out();
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        return fail(ErrorKind::Network, "Failed to exec command on channel");
    }

    // Stream stdin, then send EOF so the remote command knows input is done
    if (input) {
        std::vector<char> chunk(FILE_CHUNK_SIZE);
        while (*input) {
            input->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            size_t len = static_cast<size_t>(input->gcount());
            size_t sent = 0;
            while (sent < len) {
                ssize_t w;
                {
                    std::lock_guard<std::mutex> lock(*mtx);
                    w = libssh2_channel_write(ch, chunk.data() + sent, len - sent);
                }
                if (w == LIBSSH2_ERROR_EAGAIN) {
                    if (Clock::now() >= deadline) return timed_out();
                    platform::sleep_ms(5);
                    continue;
                }
                if (w < 0) return fail(ErrorKind::Network, "Channel write error sending data");
                sent += static_cast<size_t>(w);
            }
        }
        if (input->bad()) return fail(ErrorKind::Io, "Failed reading local input");
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*mtx);
            rc = libssh2_channel_send_eof(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) return timed_out();
        platform::sleep_ms(10);
    }

    // Read stdout and stderr until the remote side closes
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n_out;
        {
            std::lock_guard<std::mutex> lock(*mtx);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
        }
        if (n_out > 0) {
            if (sink) {
                sink->write(buf, n_out);
                if (!*sink) return fail(ErrorKind::Io, "Failed writing local output");
            } else {
                r.output.append(buf, static_cast<size_t>(n_out));
            }
        } else if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            return fail(ErrorKind::Network, "SSH channel read error");
        }

        ssize_t n_err;
        {
            std::lock_guard<std::mutex> lock(*mtx);
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        }
        if (n_err > 0) {
            r.output.append(buf, static_cast<size_t>(n_err));
        } else if (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN) {
            return fail(ErrorKind::Network, "SSH channel read error (stderr)");
        }

        if (n_out > 0 || n_err > 0) continue;

        bool eof;
        {
            std::lock_guard<std::mutex> lock(*mtx);
            eof = libssh2_channel_eof(ch) != 0;
        }
        if (eof) break;
        if (Clock::now() >= deadline) return timed_out();
        platform::sleep_ms(10);
    }

    // Exit status is only valid once the channel is closed
    auto close_deadline = Clock::now() + std::chrono::seconds(2);
    do {
        std::lock_guard<std::mutex> lock(*mtx);
        rc = libssh2_channel_close(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && Clock::now() < close_deadline &&
             (platform::sleep_ms(10), true));
    {
        std::lock_guard<std::mutex> lock(*mtx);
        r.exit_code = (rc == 0) ? libssh2_channel_get_exit_status(ch) : -1;
        libssh2_channel_free(ch);
    }

    r.duration = elapsed();
    return Result<RemoteResult>::Ok(r);
}

Result<RemoteResult> SSHConnection::execute(const std::string& command, Deadline deadline) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (!connected_locked()) {
        return Result<RemoteResult>::Err(ErrorKind::NotConnected,
            "Not connected to " + config_.name);
    }

    auto result = run_channel(command, nullptr, nullptr, deadline);
    if (result.is_ok()) {
        fleet_log_remote("exec[" + config_.name + "]", result.value);
    } else {
        fleet_log(fmt::format("exec[{}] {} failed: {}", config_.name, command, result.error));
    }
    return result;
}

// ── File transfer ─────────────────────────────────────────

Result<void> SSHConnection::upload_file(const fs::path& local, const std::string& remote,
                                        Deadline deadline) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (!connected_locked()) {
        return Result<void>::Err(ErrorKind::NotConnected, "Not connected to " + config_.name);
    }

    std::ifstream file(local, std::ios::binary);
    if (!file) {
        return Result<void>::Err(ErrorKind::Io, "Cannot read file: " + local.string());
    }

    auto result = run_channel("cat > " + shell_quote(remote), &file, nullptr, deadline);
    if (result.is_err()) return Result<void>::Err(result);
    if (result.value.timed_out) {
        return Result<void>::Err(ErrorKind::Timeout,
            fmt::format("Upload of {} to {}:{} timed out", local.string(), config_.name, remote));
    }
    if (result.value.exit_code != 0) {
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Remote write to {}:{} failed (exit {}): {}", config_.name, remote,
                        result.value.exit_code, trimmed(result.value.output)));
    }

    fleet_log(fmt::format("upload[{}] {} -> {} ({}ms)", config_.name, local.string(), remote,
                          result.value.duration.count()));
    return Result<void>::Ok();
}

Result<void> SSHConnection::download_file(const std::string& remote, const fs::path& local,
                                          Deadline deadline) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (!connected_locked()) {
        return Result<void>::Err(ErrorKind::NotConnected, "Not connected to " + config_.name);
    }

    std::error_code ec;
    if (local.has_parent_path()) {
        fs::create_directories(local.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::Io,
                "Cannot create " + local.parent_path().string() + ": " + ec.message());
        }
    }

    Result<RemoteResult> result = Result<RemoteResult>::Err(ErrorKind::Io, "");
    {
        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(ErrorKind::Io, "Cannot write file: " + local.string());
        }
        result = run_channel("cat " + shell_quote(remote), nullptr, &out, deadline);
    }

    auto discard = [&local]() {
        std::error_code rm_ec;
        fs::remove(local, rm_ec);
    };

    if (result.is_err()) {
        discard();
        return Result<void>::Err(result);
    }
    if (result.value.timed_out) {
        discard();
        return Result<void>::Err(ErrorKind::Timeout,
            fmt::format("Download of {}:{} timed out", config_.name, remote));
    }
    if (result.value.exit_code != 0) {
        discard();
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Remote read of {}:{} failed (exit {}): {}", config_.name, remote,
                        result.value.exit_code, trimmed(result.value.output)));
    }

    fleet_log(fmt::format("download[{}] {} -> {} ({}ms)", config_.name, remote, local.string(),
                          result.value.duration.count()));
    return Result<void>::Ok();
}

// ── Tunnels ───────────────────────────────────────────────

Result<std::shared_ptr<TunnelHandle>> SSHConnection::create_tunnel(int local_port,
                                                                   const std::string& remote_host,
                                                                   int remote_port) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (!connected_locked()) {
        return Result<std::shared_ptr<TunnelHandle>>::Err(ErrorKind::NotConnected,
            "Not connected to " + config_.name);
    }

    auto result = start_tunnel(*session_, local_port, remote_host, remote_port);
    if (result.is_ok()) {
        std::lock_guard<std::mutex> tlock(tunnels_mutex_);
        tunnels_.erase(std::remove_if(tunnels_.begin(), tunnels_.end(),
                           [](const std::shared_ptr<TunnelHandle>& t) { return t->stopped(); }),
                       tunnels_.end());
        tunnels_.push_back(result.value);
    }
    return result;
}
