#include "session_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::string unknown_session_message(const std::string& session_id) {
    return "Session not found: " + session_id;
}

SessionRegistry::SessionRegistry(TransportFactory& factory, BaselineOptions baseline,
                                 IdGenerator make_id)
    : factory_(factory), baseline_(std::move(baseline)),
      make_id_(make_id ? std::move(make_id) : IdGenerator(generate_session_id)) {}

SessionRegistry::~SessionRegistry() {
    close_all();
}

Result<std::string> SessionRegistry::create(const std::string& host, int port, int timeout_ms) {
    Endpoint endpoint{host, port};
    if (host.empty() || port < 1 || port > 65535) {
        return Result<std::string>::Err(
            fmt::format("Connection failed: {} - invalid endpoint", endpoint.to_string()),
            ErrorKind::ConnectionFailure);
    }

    auto opened = factory_.open(endpoint, timeout_ms);
    if (opened.is_err() || !opened.value) {
        std::string detail = opened.error.empty() ? "no transport" : opened.error;
        // Factories normally name the endpoint already; make sure of it.
        if (detail.find(endpoint.to_string()) == std::string::npos) {
            detail = fmt::format("Connection failed: {} - {}", endpoint.to_string(), detail);
        }
        return Result<std::string>::Err(detail, ErrorKind::ConnectionFailure);
    }

    auto session = std::make_shared<ConsoleSession>(make_id_(), endpoint, std::move(opened.value));
    session->initialize_baseline(baseline_);

    std::string id = session->id();
    bool inserted;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        inserted = sessions_.emplace(id, session).second;
    }
    if (!inserted) {
        // The live session under this id stays registered; the new one is dropped.
        session->close();
        telcon_log(fmt::format("[registry] id collision on {}, closed new session", id));
        return Result<std::string>::Err(
            fmt::format("Connection failed: {} - session id {} already in use",
                        endpoint.to_string(), id),
            ErrorKind::ConnectionFailure);
    }
    telcon_log(fmt::format("[registry] created {} for {}", id, endpoint.to_string()));
    return Result<std::string>::Ok(id);
}

std::vector<SessionInfo> SessionRegistry::list() const {
    std::vector<SessionInfo> infos;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    infos.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        infos.push_back(kv.second->info());
    }
    return infos;
}

Result<std::shared_ptr<ConsoleSession>> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Result<std::shared_ptr<ConsoleSession>>::Err(
            unknown_session_message(session_id), ErrorKind::UnknownSession);
    }
    return Result<std::shared_ptr<ConsoleSession>>::Ok(it->second);
}

Result<void> SessionRegistry::remove(const std::string& session_id) {
    std::shared_ptr<ConsoleSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<void>::Err(unknown_session_message(session_id),
                                     ErrorKind::UnknownSession);
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    // Waits for any in-flight command on this session.
    session->close();
    telcon_log(fmt::format("[registry] removed {}", session_id));
    return Result<void>::Ok();
}

void SessionRegistry::close_all() {
    std::unordered_map<std::string, std::shared_ptr<ConsoleSession>> doomed;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        doomed.swap(sessions_);
    }
    for (auto& kv : doomed) {
        kv.second->close();
    }
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}
