#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

enum class ReadStatus {
    Data,      // at least one byte returned
    Timeout,   // nothing arrived within the bound
    Closed,    // peer closed the stream
    Error,
};

struct ReadResult {
    ReadStatus status;
    std::string data;
    std::string error;

    bool has_data() const { return status == ReadStatus::Data && !data.empty(); }
};

// Byte stream to a console device. One owner at a time; the owning session
// serializes access, so implementations only guard against close() racing I/O.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<void> write(const std::string& data) = 0;
    virtual Result<void> flush() = 0;

    // Wait at most timeout_ms for data; returns up to max_bytes.
    virtual ReadResult read(size_t max_bytes, int timeout_ms) = 0;

    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    // Open a stream to endpoint, bounded by timeout_ms. Failures carry
    // ErrorKind::ConnectionFailure and name the endpoint.
    virtual Result<std::unique_ptr<Transport>> open(const Endpoint& endpoint, int timeout_ms) = 0;
};
