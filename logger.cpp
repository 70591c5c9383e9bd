#include "logger.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void Logger::init(spdlog::level::level_enum lvl, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%T] [%^%l%$] %v");
    sinks.push_back(console);

    auto errors = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    errors->set_pattern("[%T] [%^%l%$] %v");
    errors->set_level(spdlog::level::warn);
    sinks.push_back(errors);

    if (!file_path.empty()) {
        try {
            std::filesystem::path path(file_path);
            if (!path.parent_path().empty())
                std::filesystem::create_directories(path.parent_path());

            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            file->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
            sinks.push_back(file);
        } catch (const std::exception& e) {
            // Logger is not up yet, so report straight to stderr
            std::fprintf(stderr, "Logger: failed to open log file (%s): %s\n", file_path.c_str(),
                         e.what());
        }
    }

    spdlog::init_thread_pool(8192, 1);
    auto log = std::make_shared<spdlog::async_logger>("ntc", sinks.begin(), sinks.end(),
                                                      spdlog::thread_pool(),
                                                      spdlog::async_overflow_policy::block);
    log->set_level(lvl);
    log->flush_on(spdlog::level::warn);

    {
        std::scoped_lock lock(mutex_);
        logger_ = log;
    }

    spdlog::set_default_logger(log);
    spdlog::flush_every(std::chrono::seconds(3));
}

void Logger::flush() {
    std::shared_ptr<spdlog::logger> target;
    {
        std::scoped_lock lock(mutex_);
        target = logger_;
    }
    if (target) {
        target->flush();
    }
}

void Logger::shutdown() {
    flush();
    {
        std::scoped_lock lock(mutex_);
        logger_.reset();
    }
    spdlog::shutdown();
}
