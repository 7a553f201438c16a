#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "session.hpp"
#include "session_registry.hpp"

// Why a read loop stopped.
enum class Completion {
    Prompt,     // prompt arrived with the data
    Silence,    // quiet line, buffer already ends in a prompt (currently unreachable)
    Deadline,   // gave up; output may be partial
    WriteFailed,
};

struct ExecOutcome {
    std::string output;
    Completion completion;
    int elapsed_ms;
};

// Adaptive request/response over a prompt-driven console.
//
// Writes the command, then polls the stream in short bounded reads until the
// accumulated text ends with a device prompt or the deadline passes. Running
// out of time is not an error: whatever arrived is returned. Read hiccups are
// logged and polling continues.
class CommandExecutor {
public:
    explicit CommandExecutor(SessionRegistry& registry,
                             ExecTiming timing = ExecTiming{},
                             std::vector<std::string> slow_commands = {});

    // Fails only with UnknownSession; nothing is written in that case.
    Result<std::string> run(const std::string& session_id, const std::string& command,
                            int wait_ms);

    // Same loop on a session the caller already holds, with completion detail.
    Result<ExecOutcome> run_on(ConsoleSession& session, const std::string& command, int wait_ms);

    // Case-insensitive prefix match against the slow-command list.
    bool is_slow_command(const std::string& command) const;

    // wait_ms, raised to the slow-command floor when it applies.
    int effective_wait_ms(const std::string& command, int wait_ms) const;

    const ExecTiming& timing() const { return timing_; }
    const std::vector<std::string>& slow_commands() const { return slow_commands_; }

private:
    SessionRegistry& registry_;
    ExecTiming timing_;
    std::vector<std::string> slow_commands_;

    ExecOutcome read_until_prompt(ConsoleSession& session, int wait_ms);
};

const char* completion_name(Completion c);
