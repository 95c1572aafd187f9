#include "common/Logger.h"
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace semilev {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path dir(log_dir);
    if (dir.is_relative()) {
        dir = std::filesystem::current_path() / dir;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create log directory " + dir.string() + ": " + ec.message());
    }

    try {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // 5 MB x 3 files
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (dir / "semilev.log").string(), 5 * 1024 * 1024, 3);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console, rotating};
        main_logger_ = std::make_shared<spdlog::logger>("semilev", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        fill_logger_ = spdlog::basic_logger_mt("fills", (dir / "fills.csv").string(), true);
        fill_logger_->set_pattern("%v");
        fill_logger_->info("run_id,timestamp,symbol,type,mode,reason,price,shares,leverage,realized_pnl,cash_after");
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }

    initialized_ = true;
    main_logger_->info("Logging to {} at level {}", dir.string(), level);
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logFill(const FillRow& row) {
    if (!fill_logger_) {
        return;
    }
    fill_logger_->info("{},{},{},{},{},{},{:.4f},{:.4f},{:.2f},{:.2f},{:.2f}",
                       row.run_id, row.timestamp, row.symbol, row.type, row.mode, row.reason,
                       row.price, row.shares, row.leverage, row.realized_pnl, row.cash_after);
}

} // namespace semilev
