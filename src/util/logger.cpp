#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>

namespace chipper {

namespace {

std::atomic<bool> g_verbose{false};

void set_global_pattern(spdlog::logger& logger) {
    logger.set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
}

spdlog::level::level_enum current_level() {
    return g_verbose.load() ? spdlog::level::debug : spdlog::level::info;
}

} // namespace

Logger create_logger(const std::string& tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
        logger = spdlog::stdout_color_mt(tag);
        set_global_pattern(*logger);
        logger->set_level(current_level());
    }
    return logger;
}

void set_verbose_logging(bool verbose) {
    g_verbose = verbose;
    auto level = current_level();
    spdlog::apply_all([level](const Logger& logger) { logger->set_level(level); });
}

} // namespace chipper
