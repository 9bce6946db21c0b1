#ifndef SID_LOGGER_H
#define SID_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace sid {

struct LogConfig {
    // Empty disables the rotating file sink.
    std::string file = "speakerid.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool console = true;
    spdlog::level::level_enum level = spdlog::level::info;

    // Defaults overridden by SPEAKERID_LOG_FILE and SPEAKERID_LOG_LEVEL.
    static LogConfig from_environment();
};

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void init() { init(LogConfig::from_environment()); }
    void init(const LogConfig& config);

    std::shared_ptr<spdlog::logger>& get() {
        if (!initialized_) {
            init();
        }
        return logger_;
    }

    // Sinks pass everything through; the logger level is the only filter.
    void set_level(spdlog::level::level_enum level) {
        get()->set_level(level);
    }

    void shutdown();

private:
    Logger() = default;
    ~Logger() { shutdown(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    bool initialized_ = false;
};

} // namespace sid

#define SID_LOG_TRACE(...) sid::Logger::instance().get()->trace(__VA_ARGS__)
#define SID_LOG_DEBUG(...) sid::Logger::instance().get()->debug(__VA_ARGS__)
#define SID_LOG_INFO(...)  sid::Logger::instance().get()->info(__VA_ARGS__)
#define SID_LOG_WARN(...)  sid::Logger::instance().get()->warn(__VA_ARGS__)
#define SID_LOG_ERROR(...) sid::Logger::instance().get()->error(__VA_ARGS__)

#endif // SID_LOGGER_H
