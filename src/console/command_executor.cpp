#include "command_executor.hpp"
#include "prompt_detector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <mutex>

using Clock = std::chrono::steady_clock;

static int ms_between(Clock::time_point a, Clock::time_point b) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count());
}

const char* completion_name(Completion c) {
    switch (c) {
    case Completion::Prompt:      return "prompt";
    case Completion::Silence:     return "silence";
    case Completion::Deadline:    return "deadline";
    case Completion::WriteFailed: return "write-failed";
    }
    return "?";
}

CommandExecutor::CommandExecutor(SessionRegistry& registry, ExecTiming timing,
                                 std::vector<std::string> slow_commands)
    : registry_(registry), timing_(timing) {
    if (slow_commands.empty()) {
        slow_commands_.assign(std::begin(DEFAULT_SLOW_COMMANDS), std::end(DEFAULT_SLOW_COMMANDS));
    } else {
        for (auto& cmd : slow_commands) {
            auto lower = to_lower(cmd);
            trim(lower);
            if (!lower.empty()) slow_commands_.push_back(lower);
        }
    }
}

bool CommandExecutor::is_slow_command(const std::string& command) const {
    auto lower = to_lower(command);
    trim(lower);
    for (const auto& prefix : slow_commands_) {
        if (lower.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

int CommandExecutor::effective_wait_ms(const std::string& command, int wait_ms) const {
    if (is_slow_command(command)) {
        return std::max(wait_ms, timing_.slow_command_floor_ms);
    }
    return wait_ms;
}

Result<std::string> CommandExecutor::run(const std::string& session_id,
                                         const std::string& command, int wait_ms) {
    auto found = registry_.find(session_id);
    if (found.is_err()) {
        return Result<std::string>::Err(found.error, found.kind);
    }

    auto outcome = run_on(*found.value, command, wait_ms);
    if (outcome.is_err()) {
        return Result<std::string>::Err(outcome.error, outcome.kind);
    }
    return Result<std::string>::Ok(std::move(outcome.value.output));
}

Result<ExecOutcome> CommandExecutor::run_on(ConsoleSession& session, const std::string& command,
                                            int wait_ms) {
    int effective = effective_wait_ms(command, wait_ms);

    std::lock_guard<std::mutex> lock(session.command_mutex());
    // Removed while we waited for the lock.
    if (session.is_closed()) {
        return Result<ExecOutcome>::Err(unknown_session_message(session.id()),
                                        ErrorKind::UnknownSession);
    }

    auto tag = fmt::format("[exec {}]", session.id().substr(0, 8));
    if (effective != wait_ms) {
        telcon_log(fmt::format("{} slow command, wait raised {}ms -> {}ms", tag, wait_ms, effective));
    }

    auto written = session.write_line(command);
    if (written.is_err()) {
        telcon_log(fmt::format("{} write failed: {}", tag, written.error));
        return Result<ExecOutcome>::Ok(ExecOutcome{"", Completion::WriteFailed, 0});
    }

    auto outcome = read_until_prompt(session, effective);
    telcon_log(fmt::format("{} done by {} after {}ms", tag,
                           completion_name(outcome.completion), outcome.elapsed_ms));
    telcon_log_exec(tag, command, outcome.output);
    return Result<ExecOutcome>::Ok(std::move(outcome));
}

ExecOutcome CommandExecutor::read_until_prompt(ConsoleSession& session, int wait_ms) {
    Transport& transport = session.transport();
    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(wait_ms);
    auto last_data = start;
    std::string output;
    bool noise_logged = false;

    while (true) {
        auto now = Clock::now();
        if (now >= deadline) {
            return ExecOutcome{output, Completion::Deadline, ms_between(start, now)};
        }

        int bound = std::min(timing_.poll_interval_ms, std::max(1, ms_between(now, deadline)));
        auto r = transport.read(CONSOLE_READ_BUF_SIZE, bound);

        if (r.has_data()) {
            output += r.data;
            last_data = Clock::now();

            if (ends_with_prompt(output)) {
                // Absorb a trailing fragment, if any.
                platform::sleep_ms(timing_.grace_ms);
                auto extra = transport.read(CONSOLE_READ_BUF_SIZE, timing_.poll_interval_ms);
                if (extra.has_data()) {
                    output += extra.data;
                }
                return ExecOutcome{output, Completion::Prompt, ms_between(start, Clock::now())};
            }
        } else if (r.status == ReadStatus::Timeout) {
            // The buffer is unchanged since the arrival test above and
            // ends_with_prompt is pure, so this cannot fire today. It is the
            // idle-line fallback for a completion test that looks beyond the
            // buffer (e.g. a prompt that arrived before a trailing fragment).
            int silence = ms_between(last_data, Clock::now());
            if (silence >= timing_.silence_threshold_ms && !output.empty() &&
                ends_with_prompt(output)) {
                return ExecOutcome{output, Completion::Silence, ms_between(start, Clock::now())};
            }
        } else {
            // Not fatal: keep polling until the deadline, at the poll pace.
            if (!noise_logged) {
                telcon_log(fmt::format("[exec {}] read noise ignored: {}",
                                       session.id().substr(0, 8), r.error));
                noise_logged = true;
            }
            int remaining = ms_between(Clock::now(), deadline);
            platform::sleep_ms(std::min(timing_.poll_interval_ms, remaining));
        }
    }
}
