#pragma once

#include <string>
#include <vector>

namespace coop_catalog {

/// Server settings taken from the command line.
struct Config {
    std::string    address       = "0.0.0.0";
    unsigned short port          = 8000;
    unsigned int   threads       = 0;       // 0 = one per hardware thread
    int            idleTimeoutMs = 30000;
    bool           verbose       = false;
    bool           showHelp      = false;
};

/// Whole-string base-10 parse of the value given for @p flag.
/// @throws std::invalid_argument naming the flag and the text when it is
///         not a number or lies outside [lo, hi].
long parseNumber(const std::string& flag, const std::string& text, long lo, long hi);

/// @throws std::invalid_argument for anything outside 0-65535.
unsigned short parsePort(const std::string& text);

/// Parse the arguments that follow the program name.
/// @throws std::invalid_argument on an unknown flag or a bad value.
Config parseArgs(const std::vector<std::string>& args);

/// Usage text for --help.
std::string usage();

} // namespace coop_catalog
