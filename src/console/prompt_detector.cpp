#include "prompt_detector.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <regex>
#include <vector>

static const std::regex SUBMODE_PROMPT("[A-Za-z0-9_-]+\\([a-z0-9-]+\\)[#>]");
static const std::regex PLAIN_PROMPT("[A-Za-z0-9_-]+[#>]");
static const std::regex ANY_PROMPT("[A-Za-z0-9_-]+(\\([a-z0-9-]+\\))?[#>]");

static const char* const WHITESPACE = " \t\n\v\f\r";

std::string strip_erase_sequences(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == ' ' && i + 1 < text.size() && text[i + 1] == '\b') {
            ++i;
            continue;
        }
        if (c == '\b') continue;
        out += c;
    }
    return out;
}

std::string trailing_prompt(const std::string& clean) {
    auto last = clean.find_last_not_of(WHITESPACE);
    if (last == std::string::npos) return "";

    // The token must start right after a line break.
    auto brk = clean.find_last_of("\r\n", last);
    if (brk == std::string::npos) return "";

    std::string candidate = clean.substr(brk + 1, last - brk);
    if (std::regex_match(candidate, SUBMODE_PROMPT)) return candidate;
    if (std::regex_match(candidate, PLAIN_PROMPT)) return candidate;
    return "";
}

bool is_prompt_line(const std::string& line) {
    return std::regex_match(line, ANY_PROMPT);
}

bool ends_with_prompt(const std::string& output) {
    return !trailing_prompt(strip_erase_sequences(output)).empty();
}

std::string detect_device_mode(const std::string& output) {
    if (output.empty()) return UNKNOWN_MODE;

    std::string clean = strip_erase_sequences(output);

    auto token = trailing_prompt(clean);
    if (!token.empty()) return token;

    // Fallback: prompt echoed before a few lines of trailing noise.
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= clean.size()) {
        auto nl = clean.find('\n', start);
        std::string line = clean.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        trim(line);
        if (!line.empty()) lines.push_back(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }

    int scanned = 0;
    for (auto it = lines.rbegin(); it != lines.rend() && scanned < PROMPT_SCAN_LINES; ++it, ++scanned) {
        if (is_prompt_line(*it)) return *it;
    }

    return UNKNOWN_MODE;
}

DeviceMode classify_mode(const std::string& label) {
    if (!is_prompt_line(label)) return DeviceMode::Unknown;

    auto open = label.find('(');
    if (open == std::string::npos) {
        return label.back() == '>' ? DeviceMode::User : DeviceMode::Privileged;
    }
    auto sub = label.substr(open + 1, label.find(')', open) - open - 1);
    return sub == "config" ? DeviceMode::GlobalConfig : DeviceMode::SubConfig;
}

const char* mode_name(DeviceMode mode) {
    switch (mode) {
    case DeviceMode::User:         return "user";
    case DeviceMode::Privileged:   return "privileged";
    case DeviceMode::GlobalConfig: return "global-config";
    case DeviceMode::SubConfig:    return "sub-config";
    case DeviceMode::Unknown:      break;
    }
    return "unknown";
}
