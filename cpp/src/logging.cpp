#include "strata/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get("strata")) {
        return existing;
    }
    auto log = spdlog::stderr_color_mt("strata");
    log->set_level(spdlog::level::warn);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return log;
}

} // namespace

spdlog::logger& logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

} // namespace strata
