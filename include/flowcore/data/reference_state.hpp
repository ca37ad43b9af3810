// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <cstdint>
#include <flowcore/data/data_class.hpp>
#include <flowcore/utils/string_utils.hpp>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace flowcore::data {

/**
 * @class ReferenceState
 * @brief Occupation numbers of the reference state used in normal ordering
 *
 * Every one of the N single-particle modes is either empty (0) or filled (1).
 * Contractions between two modes with equal occupation vanish. The state is
 * immutable after construction.
 */
class ReferenceState : public DataClass {
 public:
  /**
   * @brief Construct from occupation numbers
   * @param occupations Entries must be 0 or 1
   * @throws std::invalid_argument for any other entry
   */
  explicit ReferenceState(std::vector<int> occupations);

  /**
   * @brief Construct from a string representation
   * @param str One character per mode, '0' = empty and '1' = filled
   * (e.g., "1100")
   * @throws std::invalid_argument for any other character
   */
  explicit ReferenceState(const std::string& str);

  /**
   * @brief Reference state with the lowest modes filled
   * @param num_modes Number of modes N
   * @param num_occupied Number of filled modes, counted from mode 0
   * @throws std::invalid_argument if num_occupied > num_modes
   */
  static ReferenceState fermi_sea(std::size_t num_modes,
                                  std::size_t num_occupied);

  /// Number of modes N
  std::size_t size() const { return _occupations.size(); }

  /**
   * @brief Occupation number of mode i, 0 or 1
   * @throws std::out_of_range if i >= size()
   */
  int occupation(std::size_t i) const;

  /// Occupation numbers of all modes
  const std::vector<int>& occupations() const { return _occupations; }

  std::size_t num_occupied() const;

  /**
   * @brief Whether all modes share one occupation
   *
   * For a uniform state every contraction over a mode pair is blocked.
   */
  bool is_uniform() const;

  /**
   * @brief String representation, one '0' or '1' per mode
   */
  std::string to_string() const;

  bool operator==(const ReferenceState& other) const {
    return _occupations == other._occupations;
  }

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(ReferenceState);
  }

  std::string get_summary() const override;

  nlohmann::json to_json() const override;

  /**
   * @throws std::runtime_error if the JSON is missing the occupations field
   * or carries an incompatible version
   * @throws std::invalid_argument if an occupation is not 0 or 1
   */
  static std::shared_ptr<ReferenceState> from_json(const nlohmann::json& j);

  /**
   * @brief Save to a "<name>.reference_state.json" file
   */
  void to_json_file(const std::string& filename) const override;

  static std::shared_ptr<ReferenceState> from_json_file(
      const std::string& filename);

  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<ReferenceState> from_file(const std::string& filename,
                                                   const std::string& type);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  std::vector<int> _occupations;
};

static_assert(DataClassCompliant<ReferenceState>,
              "ReferenceState must derive from DataClass and implement all "
              "required deserialization methods");

}  // namespace flowcore::data
