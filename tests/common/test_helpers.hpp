#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "temp_directory.hpp"

namespace mdvault::test {

// Test fixture base class for tests that need a vault directory
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Write root/<relative> with content, creating parent directories
  std::filesystem::path writeFile(const std::string& relative, const std::string& content);

  // Read root/<relative>; empty string if missing
  std::string readFile(const std::string& relative) const;

  std::unique_ptr<TempDirectory> sandbox_;
  std::filesystem::path temp_dir_;
};

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace mdvault::test
