#include <chrono>
#include <filesystem>
#include <fstream>
#include <toml++/toml.hpp>

#include <Nimbus++/Utils/Env.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils;
using nimbus::config::Config;
using nimbus::utils::logging::LogLevel;

using types::i32;
using types::Result;
using types::String;
using types::Unit;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ConfigTest : public Test {
 protected:
  // NOLINTBEGIN(*-non-private-member-variables-in-classes)
  fs::path       m_testDir;
  Result<String> m_originalXdg;
  // NOLINTEND(*-non-private-member-variables-in-classes)

  fn SetUp() -> Unit override {
    m_testDir = fs::temp_directory_path() / "nimbus_config_test";

    if (fs::exists(m_testDir))
      fs::remove_all(m_testDir);

    fs::create_directories(m_testDir);

    m_originalXdg = env::GetEnv("XDG_CONFIG_HOME");
    env::SetEnv("XDG_CONFIG_HOME", m_testDir.c_str());
  }

  fn TearDown() -> Unit override {
    if (m_originalXdg)
      env::SetEnv("XDG_CONFIG_HOME", m_originalXdg->c_str());
    else
      env::UnsetEnv("XDG_CONFIG_HOME");

    if (fs::exists(m_testDir))
      fs::remove_all(m_testDir);
  }

  fn writeFile(const fs::path& path, const String& content) const -> Unit {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
  }
};

TEST_F(ConfigTest, EmptyTableGivesDefaults) {
  const Config config(toml::table {});

  EXPECT_EQ(config.ipma.baseUrl, "https://api.ipma.pt/open-data");
  EXPECT_EQ(config.cache.localitiesTtl, 43200);
  EXPECT_EQ(config.cache.classesTtl, 43200);
  EXPECT_EQ(config.cache.forecastTtl, 1800);
  EXPECT_EQ(config.server.address, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8000);
  EXPECT_EQ(config.logging.level, LogLevel::Info);
}

TEST_F(ConfigTest, ReadsEverySection) {
  const Config config(toml::parse(R"toml(
[ipma]
base_url = "http://localhost:9000/open-data"

[cache]
localities_ttl = 600
classes_ttl = 300
forecast_ttl = 60

[server]
address = "127.0.0.1"
port = 8080

[logging]
level = "DEBUG"
)toml"));

  EXPECT_EQ(config.ipma.baseUrl, "http://localhost:9000/open-data");
  EXPECT_EQ(config.cache.localitiesTtl, 600);
  EXPECT_EQ(config.cache.classesTtl, 300);
  EXPECT_EQ(config.cache.forecastTtl, 60);
  EXPECT_EQ(config.server.address, "127.0.0.1");
  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.logging.level, LogLevel::Debug);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
  const Config config(toml::parse(R"toml(
[cache]
localities_ttl = 0
forecast_ttl = -5

[server]
port = 70000

[logging]
level = "chatty"
)toml"));

  EXPECT_EQ(config.cache.localitiesTtl, 43200);
  EXPECT_EQ(config.cache.forecastTtl, 1800);
  EXPECT_EQ(config.server.port, 8000);
  EXPECT_EQ(config.logging.level, LogLevel::Info);
}

TEST_F(ConfigTest, ClientConfigCarriesTtls) {
  const Config config(toml::parse(R"toml(
[cache]
forecast_ttl = 90
)toml"));

  const nimbus::services::ipma::ClientConfig client = config.clientConfig();

  EXPECT_EQ(client.baseUrl, "https://api.ipma.pt/open-data");
  EXPECT_EQ(client.localitiesTtl, 12h);
  EXPECT_EQ(client.classesTtl, 12h);
  EXPECT_EQ(client.forecastTtl, 90s);
}

TEST_F(ConfigTest, ConfigPathPrefersXdgConfigHome) {
  EXPECT_EQ(Config::getConfigPath(), m_testDir / "nimbus++" / "config.toml");
}

TEST_F(ConfigTest, UnsetXdgConfigHomeIsNotFoundAndSkipped) {
  env::UnsetEnv("XDG_CONFIG_HOME");

  const Result<String> xdg = env::GetEnv("XDG_CONFIG_HOME");

  ASSERT_FALSE(xdg.has_value());
  EXPECT_EQ(xdg.error().code, error::NimbusErrorCode::NotFound);
  EXPECT_NE(Config::getConfigPath(), m_testDir / "nimbus++" / "config.toml");
}

TEST_F(ConfigTest, ExplicitPathIsLoaded) {
  const fs::path path = m_testDir / "custom.toml";
  writeFile(path, "[server]\nport = 9100\n");

  const Config config = Config::getInstance(path);

  EXPECT_EQ(config.server.port, 9100);
}

TEST_F(ConfigTest, MissingExplicitPathGivesDefaultsWithoutCreatingIt) {
  const fs::path path = m_testDir / "absent.toml";

  const Config config = Config::getInstance(path);

  EXPECT_EQ(config.server.port, 8000);
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(ConfigTest, DefaultFileIsCreatedAndReadable) {
  const fs::path expected = m_testDir / "nimbus++" / "config.toml";

  const Config config = Config::getInstance();

  ASSERT_TRUE(fs::exists(expected));
  EXPECT_EQ(config.cache.forecastTtl, 1800);

  const Config reloaded(toml::parse_file(expected.string()));
  EXPECT_EQ(reloaded.server.port, 8000);
  EXPECT_EQ(reloaded.ipma.baseUrl, "https://api.ipma.pt/open-data");
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
  const fs::path path = m_testDir / "broken.toml";
  writeFile(path, "[server\nport = \n");

  const Config config = Config::getInstance(path);

  EXPECT_EQ(config.server.port, 8000);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
