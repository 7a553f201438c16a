#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generate_session_id();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII lower-case copy.
std::string to_lower(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Make control bytes visible for log lines ("\r" -> "\\r", 0x08 -> "\\x08").
std::string escape_control(const std::string& s, size_t max_len = 500);
