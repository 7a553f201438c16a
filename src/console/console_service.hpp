#pragma once

#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "command_executor.hpp"
#include "session_registry.hpp"

struct ConnectReply {
    std::string session_id;
    std::string device_mode;
};

struct ExecuteReply {
    std::string output;
    std::string device_mode;
};

// The operations offered to callers: connect, execute, list, disconnect.
// Errors come back as Result with a readable message; ConnectionFailure and
// UnknownSession are the only kinds the core produces.
class ConsoleService {
public:
    ConsoleService(SessionRegistry& registry, CommandExecutor& executor);

    // Opens a session, then sends an empty line to read the current prompt.
    Result<ConnectReply> connect(const std::string& host, int port,
                                 int timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS);

    Result<ExecuteReply> execute(const std::string& session_id, const std::string& command,
                                 int wait_ms = DEFAULT_WAIT_MS);

    std::vector<SessionInfo> list_sessions() const;

    Result<void> disconnect(const std::string& session_id);

private:
    SessionRegistry& registry_;
    CommandExecutor& executor_;
};

// Human-readable listing for the CLI.
std::string format_session_list(const std::vector<SessionInfo>& sessions);
