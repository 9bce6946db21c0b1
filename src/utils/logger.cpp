#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <vector>

namespace sid {

LogConfig LogConfig::from_environment() {
    LogConfig config;
    if (const char* file = std::getenv("SPEAKERID_LOG_FILE")) {
        config.file = file;
    }
    if (const char* level = std::getenv("SPEAKERID_LOG_LEVEL")) {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unrecognized names to off
        if (parsed != spdlog::level::off || std::string(level) == "off") {
            config.level = parsed;
        }
    }
    return config;
}

void Logger::init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) return;

    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;
    if (config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        sinks.push_back(console_sink);
    }

    if (!config.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            // Unwritable log directory: keep the console sink only
            if (sinks.empty()) throw;
            file_error = e.what();
        }
    }

    logger_ = std::make_shared<spdlog::logger>("speakerid", sinks.begin(), sinks.end());
    logger_->set_level(config.level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
    initialized_ = true;

    if (!file_error.empty()) {
        logger_->warn("File logging disabled: {}", file_error);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        spdlog::drop("speakerid");
        logger_.reset();
        initialized_ = false;
    }
}

} // namespace sid
