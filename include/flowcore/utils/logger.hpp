// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @def FLOWCORE_LOG_TRACE_ENTERING
 * @brief Emit a trace-level record naming the enclosing function
 *
 * Placed at the top of public entry points. The record is only formatted when
 * the active spdlog level is `trace`.
 */
#define FLOWCORE_LOG_TRACE_ENTERING()                               \
  do {                                                              \
    if (spdlog::should_log(spdlog::level::trace)) {                 \
      spdlog::trace("Entering {} ({}:{})", __func__, __FILE__,      \
                    __LINE__);                                      \
    }                                                               \
  } while (0)

namespace flowcore::utils {

/**
 * @brief Set the level of the default spdlog logger
 *
 * @param level_name One of "trace", "debug", "info", "warning", "error",
 * "critical" or "off"
 * @throws std::invalid_argument if the name is not a known level
 */
void set_log_level(const std::string& level_name);

/**
 * @brief Get the name of the level of the default spdlog logger
 * @return Level name, e.g. "info"
 */
std::string get_log_level();

}  // namespace flowcore::utils
