#include "socket_util.hpp"
#include <fmt/format.h>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <cstring>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

std::string last_socket_error() {
#ifdef _WIN32
    return fmt::format("winsock error {}", WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

static bool connect_in_progress() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EINPROGRESS;
#endif
}

bool would_block() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
#endif
}

// Shared between connect_tcp and its lookup worker. Whoever finishes last
// owns the addrinfo list.
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int gai = 0;
    struct addrinfo* res = nullptr;
};

using Clock = std::chrono::steady_clock;

// getaddrinfo has no timeout of its own; run it on a detached worker and
// wait for it no longer than the deadline. On timeout returns false and the
// worker frees its result when it eventually returns.
static bool resolve_until(const std::string& host, const std::string& port_str,
                          Clock::time_point deadline, ResolveFn resolve,
                          int& gai, struct addrinfo*& res) {
    auto pending = std::make_shared<PendingLookup>();

    std::thread([pending, host, port_str, resolve = std::move(resolve)]() {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* found = nullptr;
        int rc = resolve(host.c_str(), port_str.c_str(), &hints, &found);

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->abandoned) {
            if (rc == 0 && found) freeaddrinfo(found);
            return;
        }
        pending->gai = rc;
        pending->res = found;
        pending->done = true;
        pending->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(pending->mutex);
    if (!pending->cv.wait_until(lock, deadline, [&] { return pending->done; })) {
        pending->abandoned = true;
        return false;
    }
    gai = pending->gai;
    res = pending->res;
    return true;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             ResolveFn resolve) {
    init_networking();
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string endpoint = fmt::format("{}:{}", host, port);

    if (!resolve) {
        resolve = [](const char* h, const char* s, const struct addrinfo* hints,
                     struct addrinfo** out) { return getaddrinfo(h, s, hints, out); };
    }

    int gai = 0;
    struct addrinfo* res = nullptr;
    if (!resolve_until(host, std::to_string(port), deadline, std::move(resolve), gai, res)) {
        return Result<socket_t>::Err("Connection timed out: " + endpoint,
                                     ErrorKind::ConnectionFailure);
    }
    if (gai != 0 || !res) {
        if (res) freeaddrinfo(res);
        return Result<socket_t>::Err(
            fmt::format("Failed to resolve host: {} - {}", endpoint,
                        gai != 0 ? gai_strerror(gai) : "no addresses"),
            ErrorKind::ConnectionFailure);
    }

    std::string last_error = "no usable address";
    bool timed_out = false;

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == TELCON_INVALID_SOCKET) {
            last_error = "Failed to create socket: " + last_socket_error();
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret < 0 && !connect_in_progress()) {
            last_error = last_socket_error();
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (remaining <= 0) {
                close_socket(sock);
                timed_out = true;
                break;
            }
            int revents = poll_socket(sock, POLLOUT, static_cast<int>(remaining));
            if (revents == 0) {
                close_socket(sock);
                timed_out = true;
                break;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        int nodelay = 1;
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY,
                   reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));
        int keepalive = 1;
        setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE,
                   reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));

        freeaddrinfo(res);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(res);
    if (timed_out) {
        return Result<socket_t>::Err("Connection timed out: " + endpoint,
                                     ErrorKind::ConnectionFailure);
    }
    return Result<socket_t>::Err(fmt::format("Connection failed: {} - {}", endpoint, last_error),
                                 ErrorKind::ConnectionFailure);
}

Result<void> send_all(socket_t sock, const char* data, size_t len, int timeout_ms) {
    size_t sent = 0;
    while (sent < len) {
#ifdef _WIN32
        int n = send(sock, data + sent, static_cast<int>(len - sent), 0);
#else
        ssize_t n = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
#endif
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && would_block()) {
            if (poll_socket(sock, POLLOUT, timeout_ms) == 0) {
                return Result<void>::Err("Write stalled (socket not writable)");
            }
            continue;
        }
        return Result<void>::Err("Socket write error: " + last_socket_error());
    }
    return Result<void>::Ok();
}

} // namespace platform
