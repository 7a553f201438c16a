#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Parsed "[--wait <ms>] <command...>"
struct ExecArgs {
    int wait_ms = 0;
    std::string command;   // may be empty: an empty line reads the prompt
};

// Parsed "<host> <port> [timeout_ms]"
struct ConnectArgs {
    std::string host;
    int port = 0;
    int timeout_ms = 0;
};

// Whitespace split.
std::vector<std::string> split_args(const std::string& args);

// The remainder of the line after the first token, leading blanks removed.
std::string rest_after_first(const std::string& args);

Result<ExecArgs> parse_exec_args(const std::string& args, int default_wait_ms);
Result<ConnectArgs> parse_connect_args(const std::string& args, int default_timeout_ms);
