#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include <telnet/transport.hpp>
#include "session.hpp"

// Table of live console sessions keyed by id.
//
// The table lock guards only insert/erase/lookup. Opening a transport and the
// baseline sequence run outside it, so a slow device never stalls other
// callers. Sessions are handed out as shared_ptr: a session removed while a
// command is running stays alive until that command returns.
class SessionRegistry {
public:
    using IdGenerator = std::function<std::string()>;

    explicit SessionRegistry(TransportFactory& factory,
                             BaselineOptions baseline = BaselineOptions{},
                             IdGenerator make_id = nullptr);
    ~SessionRegistry();

    // Open, run the baseline sequence, register. No entry is left behind on
    // failure. Every failure is ConnectionFailure naming host:port, including
    // an invalid endpoint and an id the generator already handed out.
    Result<std::string> create(const std::string& host, int port, int timeout_ms);

    std::vector<SessionInfo> list() const;

    Result<std::shared_ptr<ConsoleSession>> find(const std::string& session_id) const;

    // Unregister and close. Close problems are logged and ignored.
    Result<void> remove(const std::string& session_id);

    void close_all();
    size_t size() const;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

private:
    TransportFactory& factory_;
    BaselineOptions baseline_;
    IdGenerator make_id_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConsoleSession>> sessions_;
};

// "Session not found: <id>"
std::string unknown_session_message(const std::string& session_id);
