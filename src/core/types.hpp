#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "constants.hpp"

// Failure classes that cross module boundaries.
enum class ErrorKind {
    None,
    ConnectionFailure,  // transport open failed or timed out
    UnknownSession,     // id not present in the registry
    InvalidArgument,
    Config,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::None) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::None) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Host + port of a console device
struct Endpoint {
    std::string host;
    int port = DEFAULT_TELNET_PORT;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

// Summary row for list_sessions()
struct SessionInfo {
    std::string session_id;
    std::string host;
    int port = 0;
    std::string connected_at;   // ISO 8601 local time
};

// Timing knobs for the adaptive read loop
struct ExecTiming {
    int poll_interval_ms      = POLL_INTERVAL_MS;
    int silence_threshold_ms  = SILENCE_THRESHOLD_MS;
    int grace_ms              = GRACE_MS;
    int slow_command_floor_ms = SLOW_COMMAND_FLOOR_MS;
};

// Knobs for the connect-time baseline sequence
struct BaselineOptions {
    int wake_count           = 3;
    int wake_interval_ms     = 100;
    int probe_count          = 5;
    int probe_interval_ms    = 300;
    int drain_read_ms        = 100;
    int settle_ms            = 300;
    std::string exit_config_command = "end";
    std::string pagination_command  = "terminal length 0";
};
