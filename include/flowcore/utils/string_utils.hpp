// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace flowcore::utils {

/**
 * @brief Lower a PascalCase identifier to snake_case
 *
 * "ReferenceState" becomes "reference_state"; "Settings" becomes "settings".
 */
inline std::string to_snake_case(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 4);
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isupper(uc)) {
      if (!out.empty()) out.push_back('_');
      out.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/// Data type name of a data class, computed once per call site
#define DATACLASS_TO_SNAKE_CASE(ClassName)                              \
  ([]() -> const char* {                                                \
    static const std::string snake = ::flowcore::utils::to_snake_case( \
        std::string_view(#ClassName));                                  \
    return snake.c_str();                                               \
  }())

}  // namespace flowcore::utils
