#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "telnet_codec.hpp"
#include "transport.hpp"

// Telnet over a non-blocking TCP socket. Negotiation replies are sent from
// inside read(); callers only ever see decoded console text.
class TcpTransport : public Transport {
public:
    TcpTransport(socket_t sock, Endpoint endpoint);
    ~TcpTransport() override;

    Result<void> write(const std::string& data) override;
    Result<void> flush() override;
    ReadResult read(size_t max_bytes, int timeout_ms) override;
    void close() override;
    bool is_open() const override;

    const Endpoint& endpoint() const { return endpoint_; }

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

private:
    socket_t sock_;
    Endpoint endpoint_;
    TelnetCodec codec_;
    std::string pending_;     // decoded text beyond the caller's max_bytes
    mutable std::mutex io_mutex_;

    ReadResult take_pending(size_t max_bytes);
};

class TcpTransportFactory : public TransportFactory {
public:
    Result<std::unique_ptr<Transport>> open(const Endpoint& endpoint, int timeout_ms) override;
};
