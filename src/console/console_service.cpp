#include "console_service.hpp"
#include "prompt_detector.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

ConsoleService::ConsoleService(SessionRegistry& registry, CommandExecutor& executor)
    : registry_(registry), executor_(executor) {}

Result<ConnectReply> ConsoleService::connect(const std::string& host, int port, int timeout_ms) {
    auto created = registry_.create(host, port, timeout_ms);
    if (created.is_err()) {
        return Result<ConnectReply>::Err(created.error, created.kind);
    }

    auto probe = executor_.run(created.value, "", MODE_PROBE_WAIT_MS);
    if (probe.is_err()) {
        return Result<ConnectReply>::Err(probe.error, probe.kind);
    }

    ConnectReply reply{created.value, detect_device_mode(probe.value)};
    telcon_log(fmt::format("[service] connected {}:{} as {} in mode {}",
                           host, port, reply.session_id, reply.device_mode));
    return Result<ConnectReply>::Ok(reply);
}

Result<ExecuteReply> ConsoleService::execute(const std::string& session_id,
                                             const std::string& command, int wait_ms) {
    auto output = executor_.run(session_id, command, wait_ms);
    if (output.is_err()) {
        return Result<ExecuteReply>::Err(output.error, output.kind);
    }
    std::string mode = detect_device_mode(output.value);
    return Result<ExecuteReply>::Ok(ExecuteReply{std::move(output.value), mode});
}

std::vector<SessionInfo> ConsoleService::list_sessions() const {
    auto sessions = registry_.list();
    std::sort(sessions.begin(), sessions.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.connected_at < b.connected_at;
    });
    return sessions;
}

Result<void> ConsoleService::disconnect(const std::string& session_id) {
    return registry_.remove(session_id);
}

std::string format_session_list(const std::vector<SessionInfo>& sessions) {
    if (sessions.empty()) {
        return "No active sessions\n";
    }

    std::string out = "Active sessions:\n";
    for (const auto& s : sessions) {
        out += fmt::format("- ID: {}\n", s.session_id);
        out += fmt::format("  Host: {}:{}\n", s.host, s.port);
        out += fmt::format("  Connected: {}\n", s.connected_at);
    }
    return out;
}
