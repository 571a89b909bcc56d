#pragma once

#include <functional>
#include <list>
#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <core/types.hpp>

class SessionManager;

// Per-client forwarding threads of one tunnel. Owned and driven by the
// accept thread only; finished threads are joined on the next reap().
class ForwarderSet {
public:
    ForwarderSet() = default;
    ~ForwarderSet() { join_all(); }

    ForwarderSet(const ForwarderSet&) = delete;
    ForwarderSet& operator=(const ForwarderSet&) = delete;

    void spawn(std::function<void()> fn);
    // Join every thread whose function has returned. Returns how many remain.
    size_t reap();
    void join_all();
    size_t size() const { return forwarders_.size(); }

private:
    struct Forwarder {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::list<Forwarder> forwarders_;
};

// A single active tunnel: listen socket + accept thread + one forwarding
// thread per accepted client. Stopping joins every thread it started.
class TunnelHandle {
public:
    TunnelHandle(int listen_fd, int local_port,
                 std::string remote_host, int remote_port);
    ~TunnelHandle();

    TunnelHandle(const TunnelHandle&) = delete;
    TunnelHandle& operator=(const TunnelHandle&) = delete;

    // Signal all threads and wait for them. Idempotent.
    void stop();
    bool stopped() const { return stop_.load(); }

    int local_port() const { return local_port_; }
    const std::string& remote_host() const { return remote_host_; }
    int remote_port() const { return remote_port_; }

private:
    friend Result<std::shared_ptr<TunnelHandle>> start_tunnel(
        SessionManager&, int, const std::string&, int);

    std::atomic<bool> stop_{false};
    std::mutex join_mutex_;
    std::thread accept_thread_;
    int listen_fd_;
    int local_port_;
    std::string remote_host_;
    int remote_port_;
};

// Listen on 127.0.0.1:local_port and forward each accepted connection through
// a direct-tcpip channel of `session` to remote_host:remote_port.
// local_port 0 binds an ephemeral port (see TunnelHandle::local_port()).
// The session must outlive the handle or the handle must be stopped first.
Result<std::shared_ptr<TunnelHandle>> start_tunnel(SessionManager& session,
                                                   int local_port,
                                                   const std::string& remote_host,
                                                   int remote_port);
