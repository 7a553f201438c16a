#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <console/command_executor.hpp>
#include <console/console_service.hpp>
#include <console/session_registry.hpp>
#include <telnet/tcp_transport.hpp>

class BaseCLI {
public:
    explicit BaseCLI(Config cfg);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Prints a failure and returns false when no current session is selected.
    bool require_session();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Composition root: one registry per process, owned here.
    Config config;
    TcpTransportFactory transports;
    std::unique_ptr<SessionRegistry> registry;
    std::unique_ptr<CommandExecutor> executor;
    std::unique_ptr<ConsoleService> service;

    std::string current_session;
    std::string current_mode;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
