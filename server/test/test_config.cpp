#include "Config.h"
#include "../../lib/Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace hv;

class ConfigTest : public ::testing::Test {
protected:
  std::string testDir = "/tmp/hashvote-config-test";
  logging::Logger logger = logging::getLogger("hashvote.test.config");

  void SetUp() override {
    std::filesystem::remove_all(testDir);
    std::filesystem::create_directories(testDir);
  }
  void TearDown() override { std::filesystem::remove_all(testDir); }

  void writeConfig(const std::string &content) {
    std::ofstream out(testDir + "/config.json");
    out << content;
  }
};

TEST_F(ConfigTest, DefaultsRoundTripThroughJson) {
  RunFileConfig config;
  auto j = config.ltsToJson();
  EXPECT_EQ(j["ledgerFile"], "ledger.dat");
  EXPECT_EQ(j["difficulty"]["defaultBits"], 18);
  EXPECT_EQ(j["difficulty"]["reducedBits"], 4);
  EXPECT_EQ(j["search"]["maxAttempts"], 3);

  RunFileConfig parsed;
  ASSERT_TRUE(parsed.ltsFromJson(j).isOk());
  EXPECT_EQ(parsed.difficulty.lowStakesPrefixes,
            (std::vector<std::string>{ "test_", "audit_" }));
  EXPECT_EQ(parsed.search.timeoutSeconds, 30u);
}

TEST_F(ConfigTest, CreatesDefaultFileOnFirstRun) {
  auto config = RunFileConfig::loadOrCreate(testDir, logger);
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_TRUE(std::filesystem::exists(testDir + "/config.json"));
  EXPECT_EQ(config.value().difficulty.defaultBits, 18);

  auto again = RunFileConfig::loadOrCreate(testDir, logger);
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again.value().ledgerFile, "ledger.dat");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  writeConfig(R"({"difficulty": {"defaultBits": 20}, "search": {"workers": 4}})");
  auto config = RunFileConfig::loadOrCreate(testDir, logger);
  ASSERT_TRUE(config.isOk());
  EXPECT_EQ(config.value().difficulty.defaultBits, 20);
  EXPECT_EQ(config.value().difficulty.reducedBits, 4);
  EXPECT_EQ(config.value().search.workers, 4u);
  EXPECT_EQ(config.value().searcherConfig().workers, 4u);
  EXPECT_EQ(config.value().logLevel, "INFO");
}

TEST_F(ConfigTest, RejectsInvalidValues) {
  RunFileConfig config;
  EXPECT_TRUE(config.ltsFromJson(nlohmann::json::array()).isError());
  EXPECT_TRUE(
      config.ltsFromJson({ { "difficulty", { { "defaultBits", 300 } } } })
          .isError());
  EXPECT_TRUE(
      config.ltsFromJson({ { "difficulty", { { "reducedBits", -1 } } } })
          .isError());
  EXPECT_TRUE(config.ltsFromJson({ { "search", { { "workers", 0 } } } })
                  .isError());
  EXPECT_TRUE(config.ltsFromJson({ { "logLevel", "chatty" } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "ledgerFile", "" } }).isError());
  auto err = config.ltsFromJson(
      { { "difficulty", { { "lowStakesPrefixes", { "ok_", 5 } } } } });
  ASSERT_TRUE(err.isError());
  EXPECT_EQ(err.error().code, RunFileConfig::E_CONFIG);
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
  writeConfig("{ not json");
  auto config = RunFileConfig::loadOrCreate(testDir, logger);
  ASSERT_TRUE(config.isError());
  EXPECT_EQ(config.error().code, RunFileConfig::E_CONFIG);
}
