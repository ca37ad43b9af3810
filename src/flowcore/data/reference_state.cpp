// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <flowcore/data/reference_state.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "filename_utils.hpp"
#include "json_serialization.hpp"

namespace flowcore::data {

ReferenceState::ReferenceState(std::vector<int> occupations)
    : _occupations(std::move(occupations)) {
  for (std::size_t i = 0; i < _occupations.size(); ++i) {
    if (_occupations[i] != 0 && _occupations[i] != 1) {
      throw std::invalid_argument(
          "Invalid occupation " + std::to_string(_occupations[i]) +
          " of mode " + std::to_string(i) + ": must be 0 or 1");
    }
  }
}

ReferenceState::ReferenceState(const std::string& str) {
  _occupations.reserve(str.size());
  for (char c : str) {
    switch (c) {
      case '0':
        _occupations.push_back(0);
        break;
      case '1':
        _occupations.push_back(1);
        break;
      default:
        throw std::invalid_argument(
            "Invalid character in reference state string: '" +
            std::string(1, c) + "'");
    }
  }
}

ReferenceState ReferenceState::fermi_sea(std::size_t num_modes,
                                         std::size_t num_occupied) {
  if (num_occupied > num_modes) {
    throw std::invalid_argument("Cannot fill " + std::to_string(num_occupied) +
                                " of " + std::to_string(num_modes) + " modes");
  }
  std::vector<int> occupations(num_modes, 0);
  std::fill_n(occupations.begin(), num_occupied, 1);
  return ReferenceState(std::move(occupations));
}

int ReferenceState::occupation(std::size_t i) const {
  if (i >= _occupations.size()) {
    throw std::out_of_range("Mode index " + std::to_string(i) +
                            " out of range for reference state with " +
                            std::to_string(_occupations.size()) + " modes");
  }
  return _occupations[i];
}

std::size_t ReferenceState::num_occupied() const {
  return static_cast<std::size_t>(
      std::count(_occupations.begin(), _occupations.end(), 1));
}

bool ReferenceState::is_uniform() const {
  return std::adjacent_find(_occupations.begin(), _occupations.end(),
                            std::not_equal_to<int>()) == _occupations.end();
}

std::string ReferenceState::to_string() const {
  std::string result;
  result.reserve(_occupations.size());
  for (int n : _occupations) {
    result += n ? '1' : '0';
  }
  return result;
}

std::string ReferenceState::get_summary() const {
  std::ostringstream oss;
  oss << "ReferenceState Summary:\n";
  oss << "  Representation: " << to_string() << "\n";
  oss << "  Modes: " << size() << "\n";
  oss << "  Occupied modes: " << num_occupied() << "\n";
  return oss.str();
}

nlohmann::json ReferenceState::to_json() const {
  nlohmann::json j;
  j["version"] = SERIALIZATION_VERSION;
  j["occupations"] = to_string();
  return j;
}

std::shared_ptr<ReferenceState> ReferenceState::from_json(
    const nlohmann::json& j) {
  if (j.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   j["version"].get<std::string>());
  }
  if (!j.contains("occupations")) {
    throw std::runtime_error("JSON missing required 'occupations' field");
  }
  return std::make_shared<ReferenceState>(
      j["occupations"].get<std::string>());
}

void ReferenceState::to_json_file(const std::string& filename) const {
  write_json_file(
      checked_data_filename(filename, get_data_type_name()),
      to_json());
}

std::shared_ptr<ReferenceState> ReferenceState::from_json_file(
    const std::string& filename) {
  return from_json(read_json_file(
      checked_data_filename(filename, "reference_state"),
      "ReferenceState"));
}

void ReferenceState::to_file(const std::string& filename,
                             const std::string& type) const {
  if (type != "json") {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json");
  }
  to_json_file(filename);
}

std::shared_ptr<ReferenceState> ReferenceState::from_file(
    const std::string& filename, const std::string& type) {
  if (type != "json") {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json");
  }
  return from_json_file(filename);
}

}  // namespace flowcore::data
