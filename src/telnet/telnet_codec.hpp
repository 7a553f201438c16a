#pragma once

#include <set>
#include <string>

// Minimal Telnet (RFC 854) option handling for console devices.
//
// Inbound: IAC command sequences are removed from the data stream and the
// replies they require are collected. The server may enable ECHO and
// SUPPRESS-GO-AHEAD; every other option it offers is refused, and every
// option it asks us to enable is declined. Each option is answered at most
// once per state change so a chatty server cannot start a reply loop.
// Sequences split across reads are held until complete.
//
// Outbound: data bytes equal to IAC are doubled.
class TelnetCodec {
public:
    static constexpr unsigned char IAC  = 255;
    static constexpr unsigned char DONT = 254;
    static constexpr unsigned char DO   = 253;
    static constexpr unsigned char WONT = 252;
    static constexpr unsigned char WILL = 251;
    static constexpr unsigned char SB   = 250;
    static constexpr unsigned char SE   = 240;

    static constexpr unsigned char OPT_ECHO = 1;
    static constexpr unsigned char OPT_SGA  = 3;

    // Feed raw bytes from the socket. Returns the application data they
    // carry; negotiation replies are appended to `replies`.
    std::string decode(const char* data, size_t len, std::string& replies);

    static std::string escape(const std::string& data);

    bool remote_enabled(unsigned char option) const { return remote_.count(option) > 0; }

private:
    enum class State { Data, Iac, Option, Sub, SubIac, CarriageReturn };

    State state_ = State::Data;
    unsigned char verb_ = 0;
    std::set<unsigned char> remote_;          // options the server has enabled
    std::set<unsigned char> refused_remote_;  // WILLs we answered with DONT
    std::set<unsigned char> declined_local_;  // DOs we answered with WONT

    void handle_option(unsigned char verb, unsigned char option, std::string& replies);
    static bool accept_remote(unsigned char option);
};
