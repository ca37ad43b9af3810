// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <flowcore/utils/logger.hpp>

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  if (const char* level = std::getenv("FLOWCORE_LOG_LEVEL")) {
    flowcore::utils::set_log_level(level);
  }
  std::filesystem::create_directories(TEST_OUTPUT_DIR);
  return RUN_ALL_TESTS();
}
