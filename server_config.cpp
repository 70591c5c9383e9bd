#include "server_config.h"

#include <cctype>
#include <stdexcept>
#include <vector>

namespace {

unsigned long parse_number(const std::string& text, const std::string& what, unsigned long min,
                           unsigned long max) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw std::invalid_argument(what + " must be a number, got '" + text + "'");
    }

    std::size_t   used  = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " is out of range: " + text);
    }
    if (used != text.size()) {
        throw std::invalid_argument(what + " must be a number, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw std::invalid_argument(what + " must be between " + std::to_string(min) + " and " +
                                    std::to_string(max) + ", got " + text);
    }
    return value;
}

spdlog::level::level_enum parse_level(const std::string& text) {
    auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off") {
        throw std::invalid_argument("unknown log level '" + text + "'");
    }
    return level;
}

}  // namespace

ServerConfig parse_server_config(int argc, const char* const argv[]) {
    ServerConfig             config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " expects a value");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--log-file") {
            config.log_file = value();
        } else if (arg == "--log-level") {
            config.log_level = parse_level(value());
        } else if (arg == "--idle-timeout") {
            config.idle_timeout = std::chrono::seconds(parse_number(value(), "idle timeout", 0, 86400));
        } else if (arg == "--threads") {
            config.threads = parse_number(value(), "thread count", 1, server_config::MAX_THREADS);
        } else if (arg == "--lenient-handshake") {
            config.verify_checksums = false;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2) {
        throw std::invalid_argument("too many arguments");
    }
    if (!positional.empty()) {
        config.host = positional[0];
    }
    if (positional.size() == 2) {
        config.port = static_cast<unsigned short>(parse_number(positional[1], "port", 1, 65535));
    }
    return config;
}

std::string usage(const std::string& program) {
    return "Usage: " + program +
           " [host] [port] [options]\n"
           "  host                    listen address (default " +
           server_config::DEFAULT_HOST + ")\n"
           "  port                    listen port (default " +
           std::to_string(server_config::DEFAULT_PORT) +
           ")\n"
           "  --log-file PATH         also write the log to PATH\n"
           "  --log-level LEVEL       trace, debug, info, warn, error (default info)\n"
           "  --idle-timeout SECONDS  close sessions silent for this long (0 = never)\n"
           "  --threads N             event loop threads (default 1)\n"
           "  --lenient-handshake     accept handshakes with bad checksums\n";
}
