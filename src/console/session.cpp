#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

// Upper bound on a single drain so a device that never stops talking
// cannot hold the session forever.
static constexpr int DRAIN_MAX_MS = 5000;

ConsoleSession::ConsoleSession(std::string id, Endpoint endpoint,
                               std::unique_ptr<Transport> transport)
    : id_(std::move(id)), endpoint_(std::move(endpoint)), created_at_(now_iso()),
      transport_(std::move(transport)) {}

ConsoleSession::~ConsoleSession() {
    close();
}

std::string ConsoleSession::log_tag() const {
    return fmt::format("[session {} {}]", id_.substr(0, 8), endpoint_.to_string());
}

Result<void> ConsoleSession::write_line(const std::string& text) {
    if (closed_ || !transport_) {
        return Result<void>::Err("Session closed");
    }
    auto w = transport_->write(text + LINE_TERMINATOR);
    if (w.is_err()) return w;
    return transport_->flush();
}

std::string ConsoleSession::drain(int read_ms) {
    std::string drained;
    if (closed_ || !transport_) return drained;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(DRAIN_MAX_MS);
    while (std::chrono::steady_clock::now() < deadline) {
        auto r = transport_->read(CONSOLE_DRAIN_BUF_SIZE, read_ms);
        if (!r.has_data()) {
            if (r.status == ReadStatus::Closed || r.status == ReadStatus::Error) {
                telcon_log(fmt::format("{} drain stopped: {}", log_tag(), r.error));
            }
            break;
        }
        drained += r.data;
    }
    return drained;
}

std::string ConsoleSession::initialize_baseline(const BaselineOptions& options) {
    std::lock_guard<std::mutex> lock(cmd_mutex_);
    auto tag = log_tag();

    auto send = [&](const std::string& text, const char* step) {
        auto r = write_line(text);
        if (r.is_err()) {
            telcon_log(fmt::format("{} {} write failed: {}", tag, step, r.error));
        }
    };

    // Press-any-key banners
    for (int i = 0; i < options.wake_count; ++i) {
        send("", "wake");
        platform::sleep_ms(options.wake_interval_ms);
    }

    // "?" is valid in every mode and always answers, which also warms the path
    for (int i = 0; i < options.probe_count; ++i) {
        send("?", "probe");
        platform::sleep_ms(options.probe_interval_ms);
    }

    std::string initial = drain(options.drain_read_ms);
    telcon_log(fmt::format("{} baseline drained {} bytes", tag, initial.size()));

    // Never hand back a session parked in a configuration mode we did not enter.
    if (initial.find(CONFIG_MODE_MARKER) != std::string::npos) {
        telcon_log(fmt::format("{} configuration mode detected, sending '{}'",
                               tag, options.exit_config_command));
        send(options.exit_config_command, "exit-config");
        platform::sleep_ms(options.settle_ms);
        drain(options.drain_read_ms);
    }

    send(options.pagination_command, "paging");
    platform::sleep_ms(options.settle_ms);
    drain(options.drain_read_ms);

    telcon_log(fmt::format("{} baseline complete", tag));
    return initial;
}

void ConsoleSession::close() {
    std::lock_guard<std::mutex> lock(cmd_mutex_);
    if (closed_) return;
    closed_ = true;
    if (transport_) {
        transport_->close();
    }
    telcon_log(fmt::format("{} closed", log_tag()));
}

bool ConsoleSession::is_closed() const {
    return closed_;
}

SessionInfo ConsoleSession::info() const {
    return SessionInfo{id_, endpoint_.host, endpoint_.port, created_at_};
}
