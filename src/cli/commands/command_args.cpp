#include "command_args.hpp"
#include <core/utils.hpp>
#include <sstream>

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::string rest_after_first(const std::string& args) {
    auto start = args.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = args.find_first_of(" \t", start);
    if (end == std::string::npos) return "";
    auto rest = args.find_first_not_of(" \t", end);
    if (rest == std::string::npos) return "";
    return args.substr(rest);
}

Result<ExecArgs> parse_exec_args(const std::string& args, int default_wait_ms) {
    ExecArgs parsed;
    parsed.wait_ms = default_wait_ms;

    std::string rest = args;
    auto toks = split_args(args);
    if (!toks.empty() && toks[0] == "--wait") {
        if (toks.size() < 2) {
            return Result<ExecArgs>::Err("--wait needs a value in milliseconds",
                                         ErrorKind::InvalidArgument);
        }
        int wait = safe_stoi(toks[1], -1);
        if (wait <= 0) {
            return Result<ExecArgs>::Err("Invalid --wait value: " + toks[1],
                                         ErrorKind::InvalidArgument);
        }
        parsed.wait_ms = wait;
        rest = rest_after_first(rest_after_first(args));
    }

    // The command goes to the device verbatim apart from outer blanks.
    trim(rest);
    parsed.command = rest;
    return Result<ExecArgs>::Ok(parsed);
}

Result<ConnectArgs> parse_connect_args(const std::string& args, int default_timeout_ms) {
    auto toks = split_args(args);
    if (toks.size() < 2 || toks.size() > 3) {
        return Result<ConnectArgs>::Err("Usage: connect <host> <port> [timeout_ms]",
                                        ErrorKind::InvalidArgument);
    }

    ConnectArgs parsed;
    parsed.host = toks[0];
    parsed.port = safe_stoi(toks[1], -1);
    if (parsed.port < 1 || parsed.port > 65535) {
        return Result<ConnectArgs>::Err("Invalid port: " + toks[1], ErrorKind::InvalidArgument);
    }

    parsed.timeout_ms = default_timeout_ms;
    if (toks.size() == 3) {
        parsed.timeout_ms = safe_stoi(toks[2], -1);
        if (parsed.timeout_ms <= 0) {
            return Result<ConnectArgs>::Err("Invalid timeout: " + toks[2],
                                            ErrorKind::InvalidArgument);
        }
    }
    return Result<ConnectArgs>::Ok(parsed);
}
