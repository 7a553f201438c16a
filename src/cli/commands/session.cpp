#include "../base_cli.hpp"
#include "../theme.hpp"
#include "command_args.hpp"
#include <console/prompt_detector.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_output(const ExecuteReply& reply) {
    std::cout << reply.output;
    if (!reply.output.empty() && reply.output.back() != '\n') std::cout << "\n";
    std::cout << theme::dim(fmt::format("    [mode {} ({})]", reply.device_mode,
                                        mode_name(classify_mode(reply.device_mode))))
              << "\n";
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    auto parsed = parse_connect_args(arg, cli.config.connect_timeout_ms());
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }

    const auto& a = parsed.value;
    std::cout << theme::dim(fmt::format("    Connecting to {}:{}...", a.host, a.port)) << "\n";
    auto result = cli.service->connect(a.host, a.port, a.timeout_ms);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }

    cli.current_session = result.value.session_id;
    cli.current_mode = result.value.device_mode;
    std::cout << theme::ok("Connected");
    std::cout << theme::kv("Session", result.value.session_id);
    std::cout << theme::kv("Mode", fmt::format("{} ({})", result.value.device_mode,
                                               mode_name(classify_mode(result.value.device_mode))));
}

static void run_and_print(BaseCLI& cli, const std::string& session_id, const std::string& args) {
    auto parsed = parse_exec_args(args, cli.config.wait_ms());
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }

    auto result = cli.service->execute(session_id, parsed.value.command, parsed.value.wait_ms);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        if (result.kind == ErrorKind::UnknownSession && session_id == cli.current_session) {
            cli.current_session.clear();
            cli.current_mode.clear();
        }
        return;
    }

    if (session_id == cli.current_session) {
        cli.current_mode = result.value.device_mode;
    }
    print_output(result.value);
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    run_and_print(cli, cli.current_session, arg);
}

static void do_send(BaseCLI& cli, const std::string& arg) {
    auto toks = split_args(arg);
    if (toks.empty()) {
        std::cout << theme::fail("Usage: send <session-id> [--wait <ms>] <command>");
        return;
    }
    run_and_print(cli, toks[0], rest_after_first(arg));
}

static void do_mode(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    run_and_print(cli, cli.current_session, "--wait " + std::to_string(MODE_PROBE_WAIT_MS));
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    auto toks = split_args(arg);
    if (toks.size() != 1) {
        std::cout << theme::fail("Usage: use <session-id>");
        return;
    }

    auto found = cli.registry->find(toks[0]);
    if (found.is_err()) {
        std::cout << theme::fail(found.error);
        return;
    }
    cli.current_session = toks[0];
    cli.current_mode = "?";
    std::cout << theme::ok("Using " + found.value->endpoint().to_string());
}

static void do_sessions(BaseCLI& cli, const std::string& arg) {
    auto sessions = cli.service->list_sessions();
    std::cout << theme::section("Sessions");
    if (sessions.empty()) {
        std::cout << theme::dim("    " + format_session_list(sessions));
        return;
    }
    for (const auto& s : sessions) {
        std::string marker = (s.session_id == cli.current_session) ? " *" : "";
        std::cout << theme::kv("ID", s.session_id + marker);
        std::cout << theme::kv("Host", fmt::format("{}:{}", s.host, s.port));
        std::cout << theme::kv("Connected", s.connected_at) << "\n";
    }
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    auto toks = split_args(arg);
    std::string id = toks.empty() ? cli.current_session : toks[0];
    if (id.empty()) {
        std::cout << theme::fail("Usage: disconnect [session-id]");
        return;
    }

    auto result = cli.service->disconnect(id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (id == cli.current_session) {
        cli.current_session.clear();
        cli.current_mode.clear();
    }
    std::cout << theme::ok("Disconnected " + id);
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Open a session: connect <host> <port> [timeout_ms]");
    cli.add_command("exec", do_exec, "Run on current session: exec [--wait <ms>] <command>");
    cli.add_command("send", do_send, "Run on a session: send <id> [--wait <ms>] <command>");
    cli.add_command("mode", do_mode, "Show the current device prompt/mode");
    cli.add_command("use", do_use, "Select the current session");
    cli.add_command("sessions", do_sessions, "List open sessions");
    cli.add_command("disconnect", do_disconnect, "Close a session (current if omitted)");
}
