#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

// Process-wide spdlog front end for the gateway. Calls made before init()
// are dropped, so library code and unit tests log nothing by default.
class Logger {
public:
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Colored stdout, warnings and above also on stderr, plus an optional
    // append-mode file (empty path = console only). Warnings and errors
    // flush immediately.
    void init(spdlog::level::level_enum lvl = spdlog::level::info, const std::string& file_path = "");

    template <typename... Args>
    void log(spdlog::level::level_enum lvl, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        std::shared_ptr<spdlog::logger> target;
        {
            std::scoped_lock lock(mutex_);
            target = logger_;
        }
        if (target) {
            target->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    void flush();

    // Drain the async queue and release spdlog; last call before exit
    void shutdown();

private:
    Logger()  = default;
    ~Logger() = default;

    std::mutex                      mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

namespace Log {
template <typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::err, fmt, std::forward<Args>(args)...);
}
}  // namespace Log
