#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.telcon/config.yaml (or $TELCON_CONFIG). Missing file -> defaults.
    static Result<Config> load();

    // Load a specific file. Missing file is an error here.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    int connect_timeout_ms() const { return connect_timeout_ms_; }
    int wait_ms() const { return wait_ms_; }
    const ExecTiming& timing() const { return timing_; }
    const BaselineOptions& baseline() const { return baseline_; }
    const std::vector<std::string>& slow_commands() const { return slow_commands_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& source() const { return source_; }

public:
    Config();

private:
    int connect_timeout_ms_;
    int wait_ms_;
    ExecTiming timing_;
    BaselineOptions baseline_;
    std::vector<std::string> slow_commands_;
    std::string log_file_;
    fs::path source_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

bool global_config_exists();

// Write a commented default config if none exists
Result<void> create_default_global_config();
