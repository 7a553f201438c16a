#include <iostream>
#include <vector>
#include <string>
#include "cli/telcon_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>

void print_usage() {
    std::cout << theme::banner(TELCON_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::CYAN << "    telcon"
              << theme::color::RESET << theme::color::DIM
              << "                            Interactive session shell" << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    telcon run "
              << theme::color::RESET << theme::color::AMBER << "<host> <port> <command>"
              << theme::color::RESET << theme::color::DIM
              << "  Run one command and exit" << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    telcon init-config"
              << theme::color::RESET << theme::color::DIM
              << "                Write ~/.telcon/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>       Use this config file\n"
              << "    telcon --version      Show version\n"
              << "    telcon --help         Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        std::string cmd = args.empty() ? "" : args[0];

        if (cmd == "--version") {
            std::cout << "telcon version " << TELCON_VERSION << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init-config") {
            auto created = create_default_global_config();
            if (created.is_err()) {
                std::cout << theme::fail(created.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + get_global_config_path().string());
            return 0;
        }

        auto config = config_path.empty() ? Config::load() : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        set_telcon_log_path(config.value.log_file());

        TelconCLI cli(config.value);

        if (cmd.empty()) {
            cli.run_repl();
            return 0;
        }

        if (cmd == "run") {
            if (args.size() < 3) {
                std::cout << theme::fail("Missing arguments.");
                std::cout << theme::step("Usage: telcon run <host> <port> <command>");
                return 1;
            }
            int port = safe_stoi(args[2], -1);
            if (port < 1 || port > 65535) {
                std::cout << theme::fail("Invalid port: " + args[2]);
                return 1;
            }
            std::string command;
            for (size_t i = 3; i < args.size(); ++i) {
                if (!command.empty()) command += " ";
                command += args[i];
            }
            return cli.run_once(args[1], port, command);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
