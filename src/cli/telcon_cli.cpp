#include "telcon_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <console/prompt_detector.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>
#include <fmt/format.h>

TelconCLI::TelconCLI(Config cfg) : BaseCLI(std::move(cfg)) {
    register_all_commands();
}

void TelconCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close all sessions and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close all sessions and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_session_commands(*this);
}

void TelconCLI::run_repl() {
    std::cout << theme::banner(TELCON_VERSION);
    if (!config.source().empty()) {
        std::cout << theme::kv("Config", config.source().string());
    }
    std::cout << theme::kv("Log", telcon_log_path());
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    auto open = registry->size();
    if (open > 0) {
        std::cout << theme::dim(fmt::format("    Closing {} session(s)...", open)) << "\n";
    }
    registry->close_all();
}

int TelconCLI::run_once(const std::string& host, int port, const std::string& command) {
    auto connected = service->connect(host, port, config.connect_timeout_ms());
    if (connected.is_err()) {
        std::cerr << connected.error << "\n";
        return 1;
    }

    const auto& id = connected.value.session_id;
    auto result = service->execute(id, command, config.wait_ms());
    auto closed = service->disconnect(id);
    if (closed.is_err()) {
        telcon_log("[cli] disconnect after run: " + closed.error);
    }

    if (result.is_err()) {
        std::cerr << result.error << "\n";
        return 1;
    }

    std::cout << result.value.output;
    if (!result.value.output.empty() && result.value.output.back() != '\n') std::cout << "\n";
    std::cerr << "mode: " << result.value.device_mode << "\n";
    return 0;
}
