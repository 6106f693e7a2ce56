#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace cryptogate {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "cryptogate.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        order_logger_ = spdlog::daily_logger_mt("orders", (logs_path / "orders.log").string());
        order_logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e,%v");
        order_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized (level={})", level);
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (main_logger_) {
        main_logger_->set_level(parsed);
    } else {
        spdlog::set_level(parsed);
    }
}

void Logger::logOrder(const Order& order) {
    if (!order_logger_) {
        return;
    }
    std::ostringstream oss;
    oss << order.exchange << "," << order.symbol << "," << toString(order.side) << ","
        << toString(order.type) << ","
        << std::fixed << std::setprecision(8) << order.quantity << ","
        << std::fixed << std::setprecision(8) << order.price.value_or(0.0) << ","
        << order.client_order_id << "," << order.exchange_order_id << ","
        << toString(order.status);
    order_logger_->info(oss.str());
}

} // namespace cryptogate
