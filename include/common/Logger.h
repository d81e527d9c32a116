#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace stratbench {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // Before initialize() (unit tests, library use) messages go to spdlog's default logger.
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->error(fmt, std::forward<Args>(args)...);
    }

    // One CSV line per persisted evaluation record.
    void logEvaluation(const std::string& strategy, int window_days, bool walk_forward,
                       int total_trades, double win_rate, double profit_factor,
                       double expectancy);

private:
    Logger() = default;
    spdlog::logger* target() const {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> evaluation_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) stratbench::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) stratbench::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stratbench::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stratbench::Logger::getInstance().error(__VA_ARGS__)

} // namespace stratbench
