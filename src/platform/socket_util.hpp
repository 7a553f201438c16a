#pragma once

// Cross-platform socket utilities.

#include <functional>
#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define TELCON_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <netdb.h>
#  include <poll.h>
   using socket_t = int;
#  define TELCON_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Blocking name lookup with getaddrinfo's contract.
using ResolveFn = std::function<int(const char* host, const char* service,
                                    const struct addrinfo* hints, struct addrinfo** res)>;

// Resolve host and connect a non-blocking TCP socket. timeout_ms bounds the
// whole open, name lookup included; the lookup runs on a worker thread that
// is abandoned when the deadline passes. Tries every resolved address in
// order. Errors name the endpoint. A null resolve uses getaddrinfo.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             ResolveFn resolve = nullptr);

// True when the last socket call failed only because it would block
// (EAGAIN / EWOULDBLOCK / EINTR, or WSAEWOULDBLOCK).
bool would_block();

// Send every byte, polling for writability on EAGAIN (bounded by timeout_ms per stall).
Result<void> send_all(socket_t sock, const char* data, size_t len, int timeout_ms);

// Text for the last socket error (errno / WSAGetLastError).
std::string last_socket_error();

} // namespace platform
