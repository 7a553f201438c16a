#pragma once

#include <string>

// Debug log sink: append-only text file, one "[HH:MM:SS.mmm] msg" line per call.
// Defaults to <tmp>/telcon_debug.log. Safe to call from any thread.
std::string telcon_log_path();
void set_telcon_log_path(const std::string& path);

void telcon_log(const std::string& msg);

// Log a console command and a bounded, escaped prefix of its output.
void telcon_log_exec(const std::string& label, const std::string& command,
                     const std::string& output);
