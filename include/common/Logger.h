#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace cryptogate {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);

    // initialize() 전(단위 테스트 등)에는 spdlog 기본 로거로 출력
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

    // 주문 감사 로그 (orders.log, CSV 한 줄)
    void logOrder(const Order& order);

private:
    Logger() = default;
    spdlog::logger* target() const {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> order_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) cryptogate::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) cryptogate::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) cryptogate::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) cryptogate::Logger::getInstance().error(__VA_ARGS__)

} // namespace cryptogate
