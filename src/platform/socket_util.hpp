#pragma once

// Socket helpers for the SSH transport and local tunnels (POSIX).

#include <poll.h>

using socket_t = int;
#define FLEET_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// TCP keepalive so a dead peer is noticed between commands.
void set_keepalive(socket_t sock, int idle_secs, int interval_secs);

// Pending error of a non-blocking connect (SO_ERROR), 0 when connected.
int socket_error(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket. Invalid sockets are ignored.
void close_socket(socket_t sock);

} // namespace platform
