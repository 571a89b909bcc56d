#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <filesystem>

namespace {

std::once_flag g_libssh2_init;
int g_libssh2_init_rc = 0;

// libssh2_init is not thread-safe; run it exactly once per process.
bool ensure_libssh2() {
    std::call_once(g_libssh2_init, []() { g_libssh2_init_rc = libssh2_init(0); });
    return g_libssh2_init_rc == 0;
}

bool expired(Deadline deadline) {
    return Clock::now() >= deadline;
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

} // namespace

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
    target_str_ = fmt::format("{}@{}:{}", target_.user, target_.host, target_.port);
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::establish(Deadline deadline) {
    if (!ensure_libssh2()) {
        return Result<void>::Err(ErrorKind::Network, "Failed to initialize libssh2");
    }

    auto sock_result = connect_socket(deadline);
    if (sock_result.is_err()) return sock_result;

    auto hs_result = handshake(deadline);
    if (hs_result.is_err()) {
        teardown("Handshake failed");
        return hs_result;
    }

    auto auth_result = ssh_userauth(deadline);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    fleet_log(fmt::format("session: established {}", target_str_));
    return Result<void>::Ok();
}

Result<void> SessionManager::connect_socket(Deadline deadline) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(target_.port);
    int gai = getaddrinfo(target_.host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<void>::Err(ErrorKind::Network,
            fmt::format("Failed to resolve host {}: {}", target_.host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    ErrorKind last_kind = ErrorKind::Network;

    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket() failed: ") + strerror(errno);
            continue;
        }

        // Non-blocking for libssh2 and for a bounded connect()
        platform::set_nonblocking(fd);

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = fmt::format("Failed to connect to {}:{}: {}",
                                     target_.host, target_.port, strerror(errno));
            platform::close_socket(fd);
            continue;
        }

        if (ret < 0) {
            auto wait_ms = remaining_ms(deadline);
            int revents = wait_ms > 0
                ? platform::poll_socket(fd, POLLOUT, static_cast<int>(wait_ms))
                : 0;
            if (revents == 0) {
                platform::close_socket(fd);
                last_error = fmt::format("Connection timed out: {}:{}", target_.host, target_.port);
                last_kind = ErrorKind::Timeout;
                break;
            }
            int sock_err = platform::socket_error(fd);
            if (sock_err != 0) {
                last_error = fmt::format("Connection failed: {}:{}: {}",
                                         target_.host, target_.port, strerror(sock_err));
                platform::close_socket(fd);
                continue;
            }
        }

        sock_ = fd;
        break;
    }
    freeaddrinfo(res);

    if (sock_ < 0) {
        return Result<void>::Err(last_kind, last_error);
    }

    platform::set_keepalive(sock_, 60, 15);
    return Result<void>::Ok();
}

Result<void> SessionManager::handshake(Deadline deadline) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err(ErrorKind::Network, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) {
            return Result<void>::Err(ErrorKind::Timeout, "SSH handshake timed out: " + target_str_);
        }
        platform::sleep_ms(10);
    }
    if (ret != 0) {
        return Result<void>::Err(ErrorKind::Network,
            fmt::format("SSH handshake failed ({}): {}", ret, target_str_));
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth(Deadline deadline) {
    const std::string& user = target_.user;
    int ret;

    // Key-based auth takes precedence when a key path is configured
    if (!target_.key_path.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(target_.key_path, ec)) {
            return Result<void>::Err(ErrorKind::Authentication,
                "Private key not found: " + target_.key_path);
        }
        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, user.c_str(), static_cast<unsigned int>(user.length()),
                    nullptr, target_.key_path.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                return Result<void>::Err(ErrorKind::Timeout, "Authentication timed out: " + target_str_);
            }
            platform::sleep_ms(10);
        }
        if (ret == 0) return Result<void>::Ok();
        return Result<void>::Err(ErrorKind::Authentication,
            fmt::format("Public key authentication failed for {} (key {})", target_str_, target_.key_path));
    }

    if (target_.password.empty()) {
        return Result<void>::Err(ErrorKind::Authentication,
            "No password or private key configured for " + target_str_);
    }

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (expired(deadline)) {
            return Result<void>::Err(ErrorKind::Timeout, "Authentication timed out: " + target_str_);
        }
        platform::sleep_ms(10);
    }
    std::string methods = auth_list ? auth_list : "";

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                                target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                return Result<void>::Err(ErrorKind::Timeout, "Authentication timed out: " + target_str_);
            }
            platform::sleep_ms(10);
        }
        if (ret == 0) return Result<void>::Ok();
    }

    // Servers that only offer keyboard-interactive still accept the password there
    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{target_.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                            kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return Result<void>::Err(ErrorKind::Timeout, "Authentication timed out: " + target_str_);
            }
            platform::sleep_ms(10);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorKind::Authentication,
        "Authentication failed (check username/password) for " + target_str_);
}

LIBSSH2_CHANNEL* SessionManager::open_exec_channel(Deadline deadline, std::string& error) {
    if (!active_ || !session_) {
        error = "Session is not active";
        return nullptr;
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
            if (ch) return ch;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                error = "Failed to open exec channel";
                return nullptr;
            }
        }
        if (expired(deadline)) {
            error = "Timed out opening exec channel";
            return nullptr;
        }
        platform::sleep_ms(10);
    }
}

LIBSSH2_CHANNEL* SessionManager::open_direct_tcpip(const std::string& host, int port,
                                                   Deadline deadline, std::string& error) {
    if (!active_ || !session_) {
        error = "Session is not active";
        return nullptr;
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            LIBSSH2_CHANNEL* ch = libssh2_channel_direct_tcpip(session_, host.c_str(), port);
            if (ch) return ch;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                error = fmt::format("direct-tcpip to {}:{} refused", host, port);
                return nullptr;
            }
        }
        if (expired(deadline)) {
            error = fmt::format("Timed out opening direct-tcpip to {}:{}", host, port);
            return nullptr;
        }
        platform::sleep_ms(10);
    }
}

void SessionManager::release_channel(LIBSSH2_CHANNEL* channel) {
    if (!channel) return;

    // Bounded: a dead peer must not hang the caller
    auto deadline = Clock::now() + std::chrono::seconds(2);
    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(channel);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    } while (Clock::now() < deadline);

    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_free(channel);
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, reason);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    bool was_active = active_.exchange(false);
    teardown("Normal disconnection");
    if (was_active) {
        fleet_log(fmt::format("session: closed {}", target_str_));
    }
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}
