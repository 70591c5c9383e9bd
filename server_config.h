#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <spdlog/common.h>

using namespace std::chrono_literals;

// Server configuration defaults

namespace server_config {
constexpr const char*    DEFAULT_HOST         = "0.0.0.0";
constexpr unsigned short DEFAULT_PORT         = 9000;
constexpr size_t         RECV_BUF_SIZE        = 100;  // one read carries one frame
constexpr auto           DEFAULT_IDLE_TIMEOUT = 0s;   // 0 disables the timeout
constexpr size_t         MAX_THREADS          = 64;
}  // namespace server_config

struct ServerConfig {
    std::string               host             = server_config::DEFAULT_HOST;
    unsigned short            port             = server_config::DEFAULT_PORT;
    std::string               log_file;
    spdlog::level::level_enum log_level        = spdlog::level::info;
    std::chrono::milliseconds idle_timeout     = server_config::DEFAULT_IDLE_TIMEOUT;
    std::size_t               threads          = 1;
    bool                      verify_checksums = true;
    bool                      show_help        = false;
};

// ntc_gateway [host] [port] [--log-file PATH] [--log-level LEVEL]
//             [--idle-timeout SECONDS] [--threads N] [--lenient-handshake]
// Throws std::invalid_argument on unknown options or bad values.
ServerConfig parse_server_config(int argc, const char* const argv[]);

std::string usage(const std::string& program);
