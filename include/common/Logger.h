#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace semilev {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // fills.csv is truncated per run and starts with a header row
    struct FillRow {
        std::string run_id;
        std::string timestamp;
        std::string symbol;
        std::string type;
        std::string mode;
        std::string reason;
        double price = 0.0;
        double shares = 0.0;
        double leverage = 0.0;
        double realized_pnl = 0.0;
        double cash_after = 0.0;
    };
    void logFill(const FillRow& row);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> fill_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) semilev::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) semilev::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) semilev::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) semilev::Logger::getInstance().error(__VA_ARGS__)

} // namespace semilev
