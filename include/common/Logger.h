#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <cstddef>
#include <memory>
#include <string>

namespace stratvault {

struct LogOptions {
    std::string dir = "logs";
    std::string level = "info";
    std::size_t max_file_mb = 10;
    std::size_t max_files = 3;
    bool console = true;
};

// Process-wide logging. Before initialize() every call is a no-op, so library
// code and tests can log unconditionally.
class Logger {
public:
    static Logger& getInstance();
    void initialize(const LogOptions& options = LogOptions());
    bool isInitialized() const { return initialized_; }
    void flush();

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) main_logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) main_logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) main_logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) main_logger_->error(fmt, std::forward<Args>(args)...);
    }

    // settlements.log: time,asset,from,to,amount,OK|FAILED,reference
    void logSettlement(const std::string& asset, const std::string& from,
                       const std::string& to, long long amount,
                       bool success, const std::string& reference);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> settlement_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) stratvault::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) stratvault::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stratvault::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stratvault::Logger::getInstance().error(__VA_ARGS__)

} // namespace stratvault
