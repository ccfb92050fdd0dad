#include <gtest/gtest.h>

#include <cstdlib>

#include "mdvault/config/config.hpp"
#include "test_helpers.hpp"

using namespace mdvault::config;
using namespace mdvault::test;
using mdvault::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    unsetenv(kVaultPathEnv);
  }

  void TearDown() override {
    unsetenv(kVaultPathEnv);
    unsetenv("MDVAULT_TEST_VAULT");
    TempDirTest::TearDown();
  }
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_TRUE(config.vault_path.empty());
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.logging.max_size_mb, 5);
  EXPECT_EQ(config.logging.max_files, 3);
  EXPECT_TRUE(config.tags.enforce_existing);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadFromToml) {
  auto path = writeFile("config.toml",
                        "vault_path = \"/srv/vault\"\n"
                        "\n"
                        "[logging]\n"
                        "level = \"debug\"\n"
                        "max_files = 7\n"
                        "\n"
                        "[tags]\n"
                        "enforce_existing = false\n");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.vault_path, "/srv/vault");
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.max_files, 7);
  EXPECT_EQ(config.logging.max_size_mb, 5);
  EXPECT_FALSE(config.tags.enforce_existing);
}

TEST_F(ConfigTest, LoadErrors) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "missing.toml"), ErrorCode::kConfigError);

  auto broken = writeFile("broken.toml", "vault_path = [unterminated\n");
  EXPECT_ERROR(config.load(broken), ErrorCode::kConfigError);

  auto bad_level = writeFile("level.toml", "[logging]\nlevel = \"loud\"\n");
  EXPECT_ERROR(config.load(bad_level), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  config.vault_path = "/home/me/notes";
  config.logging.level = "warn";
  config.tags.enforce_existing = false;

  auto path = temp_dir_ / "saved.toml";
  ASSERT_OK(config.save(path));

  Config reloaded;
  ASSERT_OK(reloaded.load(path));
  EXPECT_EQ(reloaded.vault_path, "/home/me/notes");
  EXPECT_EQ(reloaded.logging.level, "warn");
  EXPECT_FALSE(reloaded.tags.enforce_existing);
}

TEST_F(ConfigTest, GetAndSetByKey) {
  Config config;

  ASSERT_OK(config.set("logging.level", "error"));
  ASSERT_OK(config.set("tags.enforce_existing", "false"));
  ASSERT_OK(config.set("logging.max_size_mb", "12"));

  auto level = config.get("logging.level");
  ASSERT_OK(level);
  EXPECT_EQ(*level, "error");

  auto enforce = config.get("tags.enforce_existing");
  ASSERT_OK(enforce);
  EXPECT_EQ(*enforce, "false");
  EXPECT_EQ(config.logging.max_size_mb, 12);

  EXPECT_ERROR(config.set("logging.level", "shouting"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("logging.max_files", "many"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("tags.enforce_existing", "maybe"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.get("no.such.key"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.get(""), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, VaultPathPrecedence) {
  Config config;
  EXPECT_ERROR(config.resolveVaultPath(), ErrorCode::kVaultNotConfigured);

  config.vault_path = "/from/config";
  auto resolved = config.resolveVaultPath();
  ASSERT_OK(resolved);
  EXPECT_EQ(resolved->string(), "/from/config");

  setenv(kVaultPathEnv, "/from/env", 1);
  resolved = config.resolveVaultPath();
  ASSERT_OK(resolved);
  EXPECT_EQ(resolved->string(), "/from/env");

  resolved = config.resolveVaultPath("/from/flag");
  ASSERT_OK(resolved);
  EXPECT_EQ(resolved->string(), "/from/flag");
}

TEST_F(ConfigTest, VaultPathEnvReference) {
  Config config;
  config.vault_path = "env:MDVAULT_TEST_VAULT";
  EXPECT_ERROR(config.resolveVaultPath(), ErrorCode::kVaultNotConfigured);

  setenv("MDVAULT_TEST_VAULT", "/indirect", 1);
  auto resolved = config.resolveVaultPath();
  ASSERT_OK(resolved);
  EXPECT_EQ(resolved->string(), "/indirect");
}
