#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <telnet/transport.hpp>

// One live console connection. Owns its transport exclusively and closes it
// exactly once. Commands on a session are serialized through command_mutex():
// the executor holds it for a whole request/response exchange, close() takes
// it so teardown never interleaves with an in-flight command.
class ConsoleSession {
public:
    ConsoleSession(std::string id, Endpoint endpoint, std::unique_ptr<Transport> transport);
    ~ConsoleSession();

    // Bring a fresh connection to a known state: wake the line, surface the
    // banner, leave any configuration mode, disable paging. Best effort;
    // silence and write failures are logged, never fatal. Returns the text
    // drained after the probe step.
    std::string initialize_baseline(const BaselineOptions& options);

    // Read and return everything buffered, one bounded read at a time, until
    // a read comes back empty. Caller must hold command_mutex().
    std::string drain(int read_ms);

    // Write text + CRLF and flush. Caller must hold command_mutex().
    Result<void> write_line(const std::string& text);

    void close();
    bool is_closed() const;

    const std::string& id() const { return id_; }
    const Endpoint& endpoint() const { return endpoint_; }
    const std::string& created_at() const { return created_at_; }
    SessionInfo info() const;

    std::mutex& command_mutex() { return cmd_mutex_; }
    Transport& transport() { return *transport_; }

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

private:
    const std::string id_;
    const Endpoint endpoint_;
    const std::string created_at_;
    std::unique_ptr<Transport> transport_;
    std::mutex cmd_mutex_;
    std::atomic<bool> closed_{false};

    std::string log_tag() const;
};
