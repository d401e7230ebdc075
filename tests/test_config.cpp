// Unit tests for environment parsing and .env loading.

#include "vod_fetch/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "fixtures/FakeSession.h"

using namespace vod_fetch;
using vod_fetch::tests::fixtures::TempDir;

TEST(ConfigTest, GetEnvIntParsesAndFallsBack)
{
  ::setenv("VOD_TEST_INT", "42", 1);
  EXPECT_EQ(Config::get_env_int("VOD_TEST_INT", 7), 42);

  ::setenv("VOD_TEST_INT", "forty-two", 1);
  EXPECT_EQ(Config::get_env_int("VOD_TEST_INT", 7), 7);

  ::unsetenv("VOD_TEST_INT");
  EXPECT_EQ(Config::get_env_int("VOD_TEST_INT", 7), 7);
}

TEST(ConfigTest, GetEnvStringTreatsEmptyAsUnset)
{
  ::setenv("VOD_TEST_STR", "", 1);
  EXPECT_EQ(Config::get_env_string("VOD_TEST_STR", "dflt"), "dflt");
  ::setenv("VOD_TEST_STR", "value", 1);
  EXPECT_EQ(Config::get_env_string("VOD_TEST_STR", "dflt"), "value");
  ::unsetenv("VOD_TEST_STR");
}

TEST(ConfigTest, LoadEnvFileAppliesEntries)
{
  TempDir dir;
  std::string path = (dir.path() / ".env").string();
  {
    std::ofstream f(path);
    f << "# device\n"
      << "\n"
      << "VOD_TEST_HOST=192.168.1.10\n"
      << "export VOD_TEST_USER = \"viewer\"\n"
      << "VOD_TEST_PASS='p=ss word'\n"
      << "not a setting\n";
  }
  ::unsetenv("VOD_TEST_HOST");
  ::unsetenv("VOD_TEST_USER");
  ::unsetenv("VOD_TEST_PASS");

  EXPECT_EQ(Config::load_env_file(path), 3);
  EXPECT_STREQ(std::getenv("VOD_TEST_HOST"), "192.168.1.10");
  EXPECT_STREQ(std::getenv("VOD_TEST_USER"), "viewer");
  EXPECT_STREQ(std::getenv("VOD_TEST_PASS"), "p=ss word");

  ::unsetenv("VOD_TEST_HOST");
  ::unsetenv("VOD_TEST_USER");
  ::unsetenv("VOD_TEST_PASS");
}

TEST(ConfigTest, LoadEnvFileNeverOverridesEnvironment)
{
  TempDir dir;
  std::string path = (dir.path() / "override.env").string();
  {
    std::ofstream f(path);
    f << "VOD_TEST_KEEP=from_file\n";
  }
  ::setenv("VOD_TEST_KEEP", "from_env", 1);

  EXPECT_EQ(Config::load_env_file(path), 0);
  EXPECT_STREQ(std::getenv("VOD_TEST_KEEP"), "from_env");
  ::unsetenv("VOD_TEST_KEEP");
}

TEST(ConfigTest, MissingEnvFileReturnsMinusOne)
{
  EXPECT_EQ(Config::load_env_file("/nonexistent/vod_fetch/.env"), -1);
}
