// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <filesystem>
#include <flowcore/data/reference_state.hpp>
#include <nlohmann/json.hpp>

#include "ut_common.hpp"

using namespace flowcore::data;

class ReferenceStateTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::filesystem::remove(std::string(TEST_OUTPUT_DIR) +
                            "/ground.reference_state.json");
  }
};

TEST_F(ReferenceStateTest, FromOccupations) {
  ReferenceState state(std::vector<int>{1, 1, 0, 0});
  EXPECT_EQ(state.size(), 4u);
  EXPECT_EQ(state.occupation(0), 1);
  EXPECT_EQ(state.occupation(3), 0);
  EXPECT_EQ(state.num_occupied(), 2u);
  EXPECT_FALSE(state.is_uniform());
  EXPECT_EQ(state.to_string(), "1100");
  EXPECT_THROW(state.occupation(4), std::out_of_range);
}

TEST_F(ReferenceStateTest, FromString) {
  ReferenceState state("0101");
  EXPECT_EQ(state.occupations(), (std::vector<int>{0, 1, 0, 1}));
  EXPECT_EQ(state, ReferenceState(std::vector<int>{0, 1, 0, 1}));
  EXPECT_FALSE(state == ReferenceState("0100"));
}

TEST_F(ReferenceStateTest, InvalidOccupations) {
  EXPECT_THROW(ReferenceState(std::vector<int>{1, 2}), std::invalid_argument);
  EXPECT_THROW(ReferenceState(std::vector<int>{-1}), std::invalid_argument);
  EXPECT_THROW(ReferenceState("10x1"), std::invalid_argument);
  EXPECT_THROW(ReferenceState("1 0"), std::invalid_argument);
}

TEST_F(ReferenceStateTest, FermiSea) {
  auto state = ReferenceState::fermi_sea(5, 2);
  EXPECT_EQ(state.to_string(), "11000");
  EXPECT_EQ(state.num_occupied(), 2u);

  EXPECT_TRUE(ReferenceState::fermi_sea(3, 0).is_uniform());
  EXPECT_TRUE(ReferenceState::fermi_sea(3, 3).is_uniform());
  EXPECT_THROW(ReferenceState::fermi_sea(3, 4), std::invalid_argument);
}

TEST_F(ReferenceStateTest, EmptyState) {
  ReferenceState state(std::string(""));
  EXPECT_EQ(state.size(), 0u);
  EXPECT_TRUE(state.is_uniform());
  EXPECT_EQ(state.to_string(), "");
}

TEST_F(ReferenceStateTest, Summary) {
  ReferenceState state("1010");
  EXPECT_EQ(state.get_data_type_name(), "reference_state");
  std::string summary = state.get_summary();
  EXPECT_NE(summary.find("ReferenceState Summary"), std::string::npos);
  EXPECT_NE(summary.find("1010"), std::string::npos);
  EXPECT_NE(summary.find("Occupied modes: 2"), std::string::npos);
}

TEST_F(ReferenceStateTest, JsonSerialization) {
  ReferenceState state("0110");
  nlohmann::json j = state.to_json();
  EXPECT_EQ(j["version"].get<std::string>(), "0.1.0");
  EXPECT_EQ(j["occupations"].get<std::string>(), "0110");

  auto restored = ReferenceState::from_json(j);
  EXPECT_EQ(*restored, state);
}

TEST_F(ReferenceStateTest, JsonErrors) {
  nlohmann::json missing = {{"version", "0.1.0"}};
  EXPECT_THROW(ReferenceState::from_json(missing), std::runtime_error);

  nlohmann::json wrong_version = {{"version", "1.0.0"},
                                  {"occupations", "01"}};
  EXPECT_THROW(ReferenceState::from_json(wrong_version), std::runtime_error);

  nlohmann::json bad_value = {{"version", "0.1.0"}, {"occupations", "012"}};
  EXPECT_THROW(ReferenceState::from_json(bad_value), std::invalid_argument);

  // Patch version differences are accepted
  nlohmann::json patched = {{"version", "0.1.7"}, {"occupations", "01"}};
  EXPECT_EQ(ReferenceState::from_json(patched)->to_string(), "01");
}

TEST_F(ReferenceStateTest, FileRoundTrip) {
  const std::string filename =
      std::string(TEST_OUTPUT_DIR) + "/ground.reference_state.json";
  auto state = ReferenceState::fermi_sea(6, 3);
  state.to_file(filename, "json");

  auto restored = ReferenceState::from_file(filename, "json");
  EXPECT_EQ(*restored, state);

  auto restored_json = ReferenceState::from_json_file(filename);
  EXPECT_EQ(*restored_json, state);
}

TEST_F(ReferenceStateTest, FileNameValidation) {
  ReferenceState state("10");
  const std::string dir(TEST_OUTPUT_DIR);
  EXPECT_THROW(state.to_json_file(dir + "/ground.json"),
               std::invalid_argument);
  EXPECT_THROW(state.to_json_file(dir + "/ground.settings.json"),
               std::invalid_argument);
  EXPECT_THROW(state.to_file(dir + "/ground.reference_state.h5", "hdf5"),
               std::invalid_argument);
  EXPECT_THROW(
      ReferenceState::from_json_file(dir + "/missing.reference_state.json"),
      std::runtime_error);
}
