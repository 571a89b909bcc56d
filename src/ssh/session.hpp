#pragma once

#include <memory>
#include <mutex>
#include <atomic>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::string key_path;      // private key file; preferred over password
};

// One authenticated libssh2 session over one TCP socket.
//
// The session runs in non-blocking mode. Every libssh2 call on the session or
// any of its channels must hold io_mutex(); callers loop on EAGAIN themselves.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish(Deadline deadline);
    void close();
    bool is_active() const;
    bool check_alive();

    // Open a "session" channel for exec. nullptr on failure or deadline.
    LIBSSH2_CHANNEL* open_exec_channel(Deadline deadline, std::string& error);

    // Open a direct-tcpip channel to host:port as seen from the remote side.
    LIBSSH2_CHANNEL* open_direct_tcpip(const std::string& host, int port,
                                       Deadline deadline, std::string& error);

    // Close and free a channel (EAGAIN-safe, bounded).
    void release_channel(LIBSSH2_CHANNEL* channel);

    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> connect_socket(Deadline deadline);
    Result<void> handshake(Deadline deadline);
    Result<void> ssh_userauth(Deadline deadline);
    void teardown(const char* reason);
};
