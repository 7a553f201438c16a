#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(Config cfg) : config(std::move(cfg)) {
    registry = std::make_unique<SessionRegistry>(transports, config.baseline());
    executor = std::make_unique<CommandExecutor>(*registry, config.timing(), config.slow_commands());
    service = std::make_unique<ConsoleService>(*registry, *executor);
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_session() {
    if (current_session.empty()) {
        std::cout << theme::fail("No session selected.");
        std::cout << theme::step("Run 'connect <host> <port>' or 'use <session-id>'.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sessions", {"connect", "use", "sessions", "disconnect"}},
        {"Commands", {"exec", "send", "mode"}},
        {"General",  {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::CYAN
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (current_session.empty()) {
        return rl_esc(theme::color::CYAN) + "telcon"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::CYAN) + "telcon"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::AMBER) + current_session.substr(0, 8)
         + rl_esc(theme::color::RESET) + "["
         + rl_esc(theme::color::GREEN) + current_mode
         + rl_esc(theme::color::RESET) + "]> ";
}
