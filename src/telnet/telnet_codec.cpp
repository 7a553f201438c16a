#include "telnet_codec.hpp"

static void append_reply(std::string& replies, unsigned char verb, unsigned char option) {
    replies += static_cast<char>(TelnetCodec::IAC);
    replies += static_cast<char>(verb);
    replies += static_cast<char>(option);
}

bool TelnetCodec::accept_remote(unsigned char option) {
    return option == OPT_ECHO || option == OPT_SGA;
}

void TelnetCodec::handle_option(unsigned char verb, unsigned char option, std::string& replies) {
    switch (verb) {
    case WILL:
        if (accept_remote(option)) {
            if (remote_.insert(option).second) append_reply(replies, DO, option);
        } else if (refused_remote_.insert(option).second) {
            append_reply(replies, DONT, option);
        }
        break;
    case WONT:
        if (remote_.erase(option) > 0) append_reply(replies, DONT, option);
        break;
    case DO:
        if (declined_local_.insert(option).second) append_reply(replies, WONT, option);
        break;
    case DONT:
        // We never enable local options, nothing to turn off.
        break;
    default:
        break;
    }
}

std::string TelnetCodec::decode(const char* data, size_t len, std::string& replies) {
    std::string out;
    out.reserve(len);

    for (size_t i = 0; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);

        switch (state_) {
        case State::Data:
            if (c == IAC) {
                state_ = State::Iac;
            } else if (c == '\r') {
                out += '\r';
                state_ = State::CarriageReturn;
            } else {
                out += static_cast<char>(c);
            }
            break;

        case State::CarriageReturn:
            // "\r\0" is a bare carriage return on the wire
            state_ = State::Data;
            if (c == '\0') {
                break;
            } else if (c == IAC) {
                state_ = State::Iac;
            } else if (c == '\r') {
                out += '\r';
                state_ = State::CarriageReturn;
            } else {
                out += static_cast<char>(c);
            }
            break;

        case State::Iac:
            if (c == IAC) {
                out += static_cast<char>(IAC);
                state_ = State::Data;
            } else if (c == WILL || c == WONT || c == DO || c == DONT) {
                verb_ = c;
                state_ = State::Option;
            } else if (c == SB) {
                state_ = State::Sub;
            } else {
                // NOP, GA, AYT, ... carry no data
                state_ = State::Data;
            }
            break;

        case State::Option:
            handle_option(verb_, c, replies);
            state_ = State::Data;
            break;

        case State::Sub:
            if (c == IAC) state_ = State::SubIac;
            break;

        case State::SubIac:
            state_ = (c == SE) ? State::Data : State::Sub;
            break;
        }
    }

    return out;
}

std::string TelnetCodec::escape(const std::string& data) {
    std::string out;
    out.reserve(data.size());
    for (char ch : data) {
        out += ch;
        if (static_cast<unsigned char>(ch) == IAC) out += ch;
    }
    return out;
}
