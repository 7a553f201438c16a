#pragma once

// ── Defaults for the exposed operations ─────────────────────
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;  // transport open bound
constexpr int DEFAULT_WAIT_MS            = 2000;  // execute() deadline
constexpr int MODE_PROBE_WAIT_MS         = 1000;  // empty command sent after connect
constexpr int DEFAULT_TELNET_PORT        = 23;

// ── Read loop ───────────────────────────────────────────────
constexpr int POLL_INTERVAL_MS           = 100;   // bounded read per iteration
constexpr int SILENCE_THRESHOLD_MS       = 1000;  // idle time before re-testing the prompt
constexpr int GRACE_MS                   = 200;   // wait after a prompt match
constexpr int SLOW_COMMAND_FLOOR_MS      = 12000; // minimum deadline for slow commands

// ── Buffer sizes ────────────────────────────────────────────
constexpr int CONSOLE_READ_BUF_SIZE      = 4096;
constexpr int CONSOLE_DRAIN_BUF_SIZE     = 4096;

// ── Mode detection ──────────────────────────────────────────
constexpr const char* UNKNOWN_MODE       = "unknown";
constexpr int PROMPT_SCAN_LINES          = 5;     // trailing lines scanned by the fallback
constexpr const char* CONFIG_MODE_MARKER = "(config";
constexpr const char* LINE_TERMINATOR    = "\r\n";

// Commands known to outlast normal interactive latency. Prefix match, lower case.
constexpr const char* DEFAULT_SLOW_COMMANDS[] = {
    "ping",
    "traceroute",
    "tracert",
    "show tech",
    "copy",
    "write",
    "reload",
    "debug",
};
