#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_session_commands(BaseCLI& cli);

class TelconCLI : public BaseCLI {
public:
    explicit TelconCLI(Config cfg);

    // Interactive readline loop. Closes every session on the way out.
    void run_repl();

    // connect, execute, print, disconnect. Returns the process exit status.
    int run_once(const std::string& host, int port, const std::string& command);

private:
    void register_all_commands();
};
