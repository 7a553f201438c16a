#pragma once

#include <string>

// Prompt grammar: NAME[(submode)]# or NAME[(submode)]>
//   NAME     [A-Za-z0-9_-]+
//   submode  [a-z0-9-]+
//
// All functions here are pure and never fail.

enum class DeviceMode {
    Unknown,
    User,           // SW1>
    Privileged,     // SW1#
    GlobalConfig,   // SW1(config)#
    SubConfig,      // SW1(config-if)#, SW1(config-router)#, ...
};

// Remove line-editing noise: " \b" erase pairs, then any remaining backspace.
// Idempotent.
std::string strip_erase_sequences(const std::string& text);

// Best guess at the device prompt ("SW1#", "SW1(config-if)#", ...), or "unknown".
//   1. sub-mode prompt on its own line ending the buffer
//   2. plain prompt on its own line ending the buffer
//   3. last few non-blank lines, newest first, that are exactly a prompt
std::string detect_device_mode(const std::string& output);

// End-of-output test used by the read loop: the cleaned buffer ends with a
// prompt that sits on its own line (trailing whitespace allowed).
bool ends_with_prompt(const std::string& output);

// Prompt token ending an already-cleaned buffer, or "" if none. Tier 1
// (sub-mode) is tried before tier 2 (plain).
std::string trailing_prompt(const std::string& clean);

// True if line is exactly one prompt token.
bool is_prompt_line(const std::string& line);

DeviceMode classify_mode(const std::string& label);
const char* mode_name(DeviceMode mode);
