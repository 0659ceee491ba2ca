#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace strata {

/**
 * Shared "strata" logger (colored stderr sink, created on first use).
 * Default level is warn so that matching stays silent.
 */
[[nodiscard]] spdlog::logger& logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace strata
