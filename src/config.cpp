#include "config.hpp"

#include <limits>
#include <stdexcept>

namespace coop_catalog {

long parseNumber(const std::string& flag, const std::string& text, long lo, long hi) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid " + flag + " value: '" + text + "'");
    }
    if (used != text.size() || value < lo || value > hi) {
        throw std::invalid_argument("Invalid " + flag + " value: '" + text +
                                    "' (expected " + std::to_string(lo) + "-" +
                                    std::to_string(hi) + ")");
    }
    return value;
}

unsigned short parsePort(const std::string& text) {
    return static_cast<unsigned short>(
        parseNumber("--port", text, 0, std::numeric_limits<unsigned short>::max()));
}

Config parseArgs(const std::vector<std::string>& args) {
    Config cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();

        if (arg == "--address" && hasValue) {
            cfg.address = args[++i];
        } else if (arg == "--port" && hasValue) {
            cfg.port = parsePort(args[++i]);
        } else if (arg == "--threads" && hasValue) {
            cfg.threads = static_cast<unsigned int>(
                parseNumber("--threads", args[++i], 0, 256));
        } else if (arg == "--idle-timeout" && hasValue) {
            cfg.idleTimeoutMs = static_cast<int>(
                parseNumber("--idle-timeout", args[++i], 1, 3600000));
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cfg;
}

std::string usage() {
    return "Usage: coop_catalog [options]\n\n"
           "Options:\n"
           "  --address ADDR      Listen address             (default: 0.0.0.0)\n"
           "  --port N            Listen port, 0 = any free  (default: 8000)\n"
           "  --threads N         Worker threads, 0 = auto   (default: 0)\n"
           "  --idle-timeout MS   Close idle connections     (default: 30000)\n"
           "  --verbose           Log every request to stderr\n"
           "  --help, -h          Show this message\n";
}

} // namespace coop_catalog
