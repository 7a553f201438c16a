#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

// Positive ints only; anything else keeps the default.
static void read_positive(const YAML::Node& node, const char* key, int& out) {
    if (!node || !node[key] || !node[key].IsScalar()) return;
    int v = node[key].as<int>(0);
    if (v > 0) out = v;
}

// Counts may legitimately be zero (skip the step).
static void read_count(const YAML::Node& node, const char* key, int& out) {
    if (!node || !node[key] || !node[key].IsScalar()) return;
    int v = node[key].as<int>(-1);
    if (v >= 0) out = v;
}

static void read_string(const YAML::Node& node, const char* key, std::string& out) {
    if (!node || !node[key] || !node[key].IsScalar()) return;
    auto v = node[key].as<std::string>("");
    if (!v.empty()) out = v;
}

static ExecTiming parse_timing(const YAML::Node& node) {
    ExecTiming t;
    read_positive(node, "poll_interval_ms", t.poll_interval_ms);
    read_positive(node, "silence_threshold_ms", t.silence_threshold_ms);
    read_positive(node, "grace_ms", t.grace_ms);
    read_positive(node, "slow_command_floor_ms", t.slow_command_floor_ms);
    return t;
}

static BaselineOptions parse_baseline(const YAML::Node& node) {
    BaselineOptions b;
    read_count(node, "wake_count", b.wake_count);
    read_count(node, "wake_interval_ms", b.wake_interval_ms);
    read_count(node, "probe_count", b.probe_count);
    read_count(node, "probe_interval_ms", b.probe_interval_ms);
    read_positive(node, "drain_read_ms", b.drain_read_ms);
    read_count(node, "settle_ms", b.settle_ms);
    read_string(node, "exit_config_command", b.exit_config_command);
    read_string(node, "pagination_command", b.pagination_command);
    return b;
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".telcon";
}

fs::path get_global_config_path() {
    const char* env = std::getenv("TELCON_CONFIG");
    if (env && *env) return fs::path(env);
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

Config::Config()
    : connect_timeout_ms_(DEFAULT_CONNECT_TIMEOUT_MS),
      wait_ms_(DEFAULT_WAIT_MS),
      slow_commands_(std::begin(DEFAULT_SLOW_COMMANDS), std::end(DEFAULT_SLOW_COMMANDS)) {}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping", ErrorKind::Config);
        }

        read_positive(root["defaults"], "connect_timeout_ms", config.connect_timeout_ms_);
        read_positive(root["defaults"], "wait_ms", config.wait_ms_);
        config.timing_ = parse_timing(root["timing"]);
        config.baseline_ = parse_baseline(root["baseline"]);

        if (root["slow_commands"] && root["slow_commands"].IsSequence()) {
            std::vector<std::string> cmds;
            for (const auto& item : root["slow_commands"]) {
                auto cmd = to_lower(item.as<std::string>(""));
                trim(cmd);
                if (!cmd.empty()) cmds.push_back(cmd);
            }
            config.slow_commands_ = cmds;
        }

        config.log_file_ = root["log_file"].as<std::string>("");
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Config);
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorKind::Config);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string(), ErrorKind::Config);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
        return result;
    }
    result.value.source_ = path;
    return result;
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_global_config_path());
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message(), ErrorKind::Config);
    }

    const char* default_config = R"(# telcon configuration

defaults:
  connect_timeout_ms: 5000         # transport open bound
  wait_ms: 2000                    # execute deadline when none is given

# Read loop timing. Device dependent; tune for slow consoles.
timing:
  poll_interval_ms: 100
  silence_threshold_ms: 1000
  grace_ms: 200
  slow_command_floor_ms: 12000

# Connect-time sequence
baseline:
  wake_count: 3
  wake_interval_ms: 100
  probe_count: 5
  probe_interval_ms: 300
  drain_read_ms: 100
  settle_ms: 300
  exit_config_command: "end"
  pagination_command: "terminal length 0"

# Commands that always get at least slow_command_floor_ms (prefix match)
slow_commands: [ping, traceroute, tracert, "show tech", copy, write, reload, debug]

# log_file: "/tmp/telcon_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string(),
                                 ErrorKind::Config);
    }
    out << default_config;
    return Result<void>::Ok();
}
