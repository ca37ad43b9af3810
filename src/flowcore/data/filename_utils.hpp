// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace flowcore::data {

/**
 * @brief Check that a data file name reads "<stem>.<data_type>.<ext>"
 *
 * Files written by data classes carry the data type before the extension,
 * e.g. "ground.reference_state.json" or "engine.settings.json".
 *
 * @param filename Path of the file
 * @param data_type Expected data type tag (e.g. "settings")
 * @return @p filename, unchanged
 * @throws std::invalid_argument if the tag is missing or different
 */
inline const std::string& checked_data_filename(const std::string& filename,
                                                std::string_view data_type) {
  const std::string_view name(filename);
  const auto ext_dot = name.rfind('.');
  const auto tag_dot =
      ext_dot == std::string_view::npos || ext_dot == 0
          ? std::string_view::npos
          : name.rfind('.', ext_dot - 1);

  if (tag_dot == std::string_view::npos) {
    throw std::invalid_argument("Invalid filename: '" + filename +
                                "' must end in '." + std::string(data_type) +
                                ".<extension>'");
  }

  const auto tag = name.substr(tag_dot + 1, ext_dot - tag_dot - 1);
  if (tag != data_type) {
    throw std::invalid_argument(
        "Invalid filename: '" + filename + "' is tagged '" + std::string(tag) +
        "' but holds '" + std::string(data_type) + "' data");
  }
  return filename;
}

}  // namespace flowcore::data
