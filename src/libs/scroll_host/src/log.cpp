#include <scroll_host/check.hpp>
#include <scroll_host/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <utility>

namespace scroll_host {

namespace {

const char* const logger_name = "linked_scroll";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> scroll_logger() {
    auto& logger = logger_slot();
    if (logger) return logger;

    logger = spdlog::get(logger_name);
    if (logger) return logger;

    try {
        logger = spdlog::stderr_color_mt(logger_name);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

void install_scroll_logger(std::shared_ptr<spdlog::logger> logger) {
    if (!logger) return;
    logger_slot() = std::move(logger);
}

void check_failed(const char* condition, const char* message, const char* file, int line) {
    auto logger = scroll_logger();
    logger->critical("check_failed condition=({}) message=\"{}\" at {}:{}", condition, message, file, line);
    logger->flush();
    std::abort();
}

} // namespace scroll_host
