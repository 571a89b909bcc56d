#include "tunnel.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>

// ── TunnelHandle ──────────────────────────────────────────

TunnelHandle::TunnelHandle(int listen_fd, int local_port,
                           std::string remote_host, int remote_port)
    : listen_fd_(listen_fd), local_port_(local_port),
      remote_host_(std::move(remote_host)), remote_port_(remote_port) {}

TunnelHandle::~TunnelHandle() {
    stop();
}

void TunnelHandle::stop() {
    stop_.store(true);
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (accept_thread_.joinable()) accept_thread_.join();
    if (listen_fd_ >= 0) {
        platform::close_socket(listen_fd_);
        listen_fd_ = -1;
    }
}

// ── ForwarderSet ──────────────────────────────────────────

void ForwarderSet::spawn(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    Forwarder f;
    f.done = done;
    f.thread = std::thread([fn = std::move(fn), done]() {
        fn();
        done->store(true);
    });
    forwarders_.push_back(std::move(f));
}

size_t ForwarderSet::reap() {
    for (auto it = forwarders_.begin(); it != forwarders_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = forwarders_.erase(it);
        } else {
            ++it;
        }
    }
    return forwarders_.size();
}

void ForwarderSet::join_all() {
    for (auto& f : forwarders_) {
        if (f.thread.joinable()) f.thread.join();
    }
    forwarders_.clear();
}

// ── Forwarding ────────────────────────────────────────────

// Pipe bytes between a local TCP socket and a direct-tcpip channel until
// either side closes or stop_flag is set. Owns client_fd and ch.
static void forward_connection(SessionManager& session,
                               int client_fd,
                               LIBSSH2_CHANNEL* ch,
                               const std::atomic<bool>& stop_flag) {
    char buf[TUNNEL_BUF_SIZE];
    auto mtx = session.io_mutex();
    bool open = true;

    while (open && !stop_flag.load()) {
        int revents = platform::poll_socket(client_fd, POLLIN, 50);

        // local → channel
        if (revents & (POLLIN | POLLHUP)) {
            ssize_t n = read(client_fd, buf, sizeof(buf));
            if (n <= 0) break;  // client closed

            ssize_t sent = 0;
            while (sent < n && !stop_flag.load()) {
                ssize_t w;
                {
                    std::lock_guard<std::mutex> lock(*mtx);
                    w = libssh2_channel_write(ch, buf + sent, static_cast<size_t>(n - sent));
                }
                if (w == LIBSSH2_ERROR_EAGAIN) {
                    platform::sleep_ms(1);
                    continue;
                }
                if (w < 0) { open = false; break; }
                sent += w;
            }
        }

        // channel → local
        while (open) {
            ssize_t n;
            bool eof = false;
            {
                std::lock_guard<std::mutex> lock(*mtx);
                n = libssh2_channel_read(ch, buf, sizeof(buf));
                if (n <= 0) eof = libssh2_channel_eof(ch) != 0;
            }
            if (n > 0) {
                ssize_t sent = 0;
                while (sent < n) {
                    ssize_t w = write(client_fd, buf + sent, static_cast<size_t>(n - sent));
                    if (w <= 0) { open = false; break; }
                    sent += w;
                }
                continue;
            }
            if (n == LIBSSH2_ERROR_EAGAIN && !eof) break;  // no data yet
            open = false;  // remote closed or channel error
        }
    }

    session.release_channel(ch);
    platform::close_socket(client_fd);
}

static void accept_loop(SessionManager& session,
                        std::string remote_host, int remote_port,
                        int listen_fd, const std::atomic<bool>& stop_flag) {
    ForwarderSet forwarders;

    while (!stop_flag.load()) {
        forwarders.reap();

        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(listen_fd, POLLIN, 200);
        if (!(revents & POLLIN)) continue;

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        int client = accept(listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &len);
        if (client < 0) continue;

        std::string error;
        LIBSSH2_CHANNEL* ch = session.open_direct_tcpip(
            remote_host, remote_port,
            deadline_in(std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS)), error);
        if (!ch) {
            fleet_log(fmt::format("tunnel: {}", error));
            platform::close_socket(client);
            continue;
        }

        forwarders.spawn([&session, client, ch, &stop_flag]() {
            forward_connection(session, client, ch, stop_flag);
        });
        fleet_log(fmt::format("tunnel: new client for {}:{} ({} active)",
                              remote_host, remote_port, forwarders.size()));
    }

    forwarders.join_all();
}

// ── Start ─────────────────────────────────────────────────

Result<std::shared_ptr<TunnelHandle>> start_tunnel(SessionManager& session,
                                                   int local_port,
                                                   const std::string& remote_host,
                                                   int remote_port) {
    using R = Result<std::shared_ptr<TunnelHandle>>;

    if (!session.is_active()) {
        return R::Err(ErrorKind::NotConnected, "Session is not active");
    }

    int listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd < 0) {
        return R::Err(ErrorKind::Network, std::string("socket() failed: ") + strerror(errno));
    }

    int reuse = 1;
    setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(local_port));
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (bind(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = fmt::format("bind() failed for port {}: {}", local_port, strerror(errno));
        platform::close_socket(listen_fd);
        return R::Err(ErrorKind::Network, err);
    }

    if (listen(listen_fd, 8) < 0) {
        std::string err = fmt::format("listen() failed for port {}: {}", local_port, strerror(errno));
        platform::close_socket(listen_fd);
        return R::Err(ErrorKind::Network, err);
    }

    int bound_port = local_port;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
        bound_port = ntohs(addr.sin_port);
    }

    auto handle = std::make_shared<TunnelHandle>(listen_fd, bound_port, remote_host, remote_port);
    handle->accept_thread_ = std::thread(accept_loop,
        std::ref(session), remote_host, remote_port, listen_fd, std::cref(handle->stop_));

    fleet_log(fmt::format("tunnel: localhost:{} -> {}:{} via {}",
                          bound_port, remote_host, remote_port, session.get_target()));
    return R::Ok(handle);
}
