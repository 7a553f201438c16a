#include "tcp_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

#ifndef _WIN32
#  include <sys/socket.h>
#endif

static constexpr int WRITE_STALL_MS = 2000;

TcpTransport::TcpTransport(socket_t sock, Endpoint endpoint)
    : sock_(sock), endpoint_(std::move(endpoint)) {}

TcpTransport::~TcpTransport() {
    close();
}

Result<void> TcpTransport::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (sock_ == TELCON_INVALID_SOCKET) {
        return Result<void>::Err("Transport closed");
    }
    std::string wire = TelnetCodec::escape(data);
    return platform::send_all(sock_, wire.data(), wire.size(), WRITE_STALL_MS);
}

Result<void> TcpTransport::flush() {
    // Sockets are unbuffered on our side; send_all already pushed every byte.
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (sock_ == TELCON_INVALID_SOCKET) {
        return Result<void>::Err("Transport closed");
    }
    return Result<void>::Ok();
}

ReadResult TcpTransport::take_pending(size_t max_bytes) {
    size_t n = std::min(max_bytes, pending_.size());
    ReadResult r{ReadStatus::Data, pending_.substr(0, n), ""};
    pending_.erase(0, n);
    return r;
}

ReadResult TcpTransport::read(size_t max_bytes, int timeout_ms) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (sock_ == TELCON_INVALID_SOCKET) {
        return ReadResult{ReadStatus::Closed, "", "Transport closed"};
    }
    if (!pending_.empty()) {
        return take_pending(max_bytes);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[CONSOLE_READ_BUF_SIZE];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining < 0) remaining = 0;

        int revents = platform::poll_socket(sock_, POLLIN, static_cast<int>(remaining));
        if (revents == 0) {
            return ReadResult{ReadStatus::Timeout, "", ""};
        }
        if ((revents & (POLLERR | POLLNVAL)) && !(revents & POLLIN)) {
            return ReadResult{ReadStatus::Error, "", "Socket error"};
        }

        auto n = recv(sock_, buf, sizeof(buf), 0);
        if (n == 0) {
            return ReadResult{ReadStatus::Closed, "", "Connection closed by peer"};
        }
        if (n < 0) {
            if (platform::would_block()) {
                if (remaining == 0) return ReadResult{ReadStatus::Timeout, "", ""};
                continue;
            }
            return ReadResult{ReadStatus::Error, "", "Socket read error: " + platform::last_socket_error()};
        }

        std::string replies;
        pending_ += codec_.decode(buf, static_cast<size_t>(n), replies);
        if (!replies.empty()) {
            auto sent = platform::send_all(sock_, replies.data(), replies.size(), WRITE_STALL_MS);
            if (sent.is_err()) {
                telcon_log(fmt::format("[telnet {}] negotiation reply failed: {}",
                                       endpoint_.to_string(), sent.error));
            }
        }

        if (!pending_.empty()) {
            return take_pending(max_bytes);
        }
        // Pure negotiation traffic; keep waiting out the bound.
        if (remaining == 0) {
            return ReadResult{ReadStatus::Timeout, "", ""};
        }
    }
}

void TcpTransport::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (sock_ != TELCON_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = TELCON_INVALID_SOCKET;
    }
    pending_.clear();
}

bool TcpTransport::is_open() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return sock_ != TELCON_INVALID_SOCKET;
}

Result<std::unique_ptr<Transport>> TcpTransportFactory::open(const Endpoint& endpoint,
                                                             int timeout_ms) {
    telcon_log(fmt::format("[telnet] connecting to {} (timeout {}ms)",
                           endpoint.to_string(), timeout_ms));

    auto sock = platform::connect_tcp(endpoint.host, endpoint.port, timeout_ms);
    if (sock.is_err()) {
        telcon_log("[telnet] " + sock.error);
        return Result<std::unique_ptr<Transport>>::Err(sock.error, ErrorKind::ConnectionFailure);
    }

    telcon_log(fmt::format("[telnet] connected to {}", endpoint.to_string()));
    return Result<std::unique_ptr<Transport>>::Ok(
        std::make_unique<TcpTransport>(sock.value, endpoint));
}
