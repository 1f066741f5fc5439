#include "common/Logger.h"
#include "common/PathUtils.h"

#include <stdexcept>
#include <vector>

namespace stratvault {

namespace {
spdlog::level::level_enum parseLevel(const std::string& name, bool& recognized) {
    const auto level = spdlog::level::from_str(name);
    recognized = level != spdlog::level::off || name == "off";
    return recognized ? level : spdlog::level::info;
}
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LogOptions& options) {
    if (initialized_) return;

    const auto logs_path = utils::PathUtils::anchored(options.dir);
    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);
    if (ec) {
        throw std::runtime_error("Log init failed: cannot create " + logs_path.string() + ": " + ec.message());
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "stratvault.log").string(),
            options.max_file_mb * 1024 * 1024,
            options.max_files));

        bool level_ok = true;
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(parseLevel(options.level, level_ok));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        settlement_logger_ = spdlog::daily_logger_mt("settlement", (logs_path / "settlements.log").string());
        settlement_logger_->set_pattern("%Y-%m-%d %H:%M:%S,%v");
        settlement_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger ready, writing to {}", logs_path.string());
        if (!level_ok) {
            main_logger_->warn("Unknown log level '{}', using info", options.level);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        settlement_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::flush() {
    if (main_logger_) main_logger_->flush();
    if (settlement_logger_) settlement_logger_->flush();
}

void Logger::logSettlement(const std::string& asset, const std::string& from,
                           const std::string& to, long long amount,
                           bool success, const std::string& reference) {
    if (!settlement_logger_) {
        return;
    }
    settlement_logger_->info("{},{},{},{},{},{}", asset, from, to, amount, success ? "OK" : "FAILED", reference);
}

} // namespace stratvault
