// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace flowcore::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers shared by the data classes
 */

/**
 * @brief Validate serialization version compatibility
 * @param expected_version The version string this code expects (e.g., "0.1.0")
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error if major or minor version mismatch
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse a semantic version string into major, minor, patch components
 * @param version_string Version string in format "major.minor.patch"
 * @return Tuple of (major, minor, patch) as integers
 * @throws std::runtime_error if version string format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/**
 * @brief Write a JSON document to a file, pretty printed
 * @throws std::runtime_error if the file cannot be opened or written
 */
void write_json_file(const std::string& filename, const nlohmann::json& j);

/**
 * @brief Read a JSON document from a file
 * @param what Name of the data type, used in error messages
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
nlohmann::json read_json_file(const std::string& filename,
                              const std::string& what);

}  // namespace flowcore::data
