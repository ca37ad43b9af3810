// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <flowcore/utils/logger.hpp>
#include <stdexcept>

namespace flowcore::utils {

void set_log_level(const std::string& level_name) {
  auto level = spdlog::level::from_str(level_name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && level_name != "off") {
    throw std::invalid_argument("Unknown log level: '" + level_name +
                                "'. Allowed levels: trace, debug, info, "
                                "warning, error, critical, off");
  }
  spdlog::set_level(level);
}

std::string get_log_level() {
  auto view = spdlog::level::to_string_view(spdlog::get_level());
  return std::string(view.data(), view.size());
}

}  // namespace flowcore::utils
