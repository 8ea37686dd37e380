#include "Logger.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public hv::logging::Handler {
public:
  struct Record {
    hv::logging::Level level;
    std::string loggerName;
    std::string message;
  };

  void emit(hv::logging::Level level, const std::string &loggerName,
            const std::string &message) override {
    if (level < level_) {
      return;
    }
    records.push_back({ level, loggerName, message });
  }

  std::vector<Record> records;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = hv::logging::getRootLogger();
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
  });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
  auto namedLogger = hv::logging::getLogger("hashvote_named");
  EXPECT_EQ(namedLogger.getName(), "hashvote_named");
  EXPECT_EQ(namedLogger.getFullName(), "hashvote_named");
}

TEST(LoggerTest, HierarchicalNameBuildsTree) {
  auto child = hv::logging::getLogger("tree_a.tree_b.tree_c");
  EXPECT_EQ(child.getName(), "tree_c");
  EXPECT_EQ(child.getFullName(), "tree_a.tree_b.tree_c");
  EXPECT_EQ(child.getParent(), hv::logging::getLogger("tree_a.tree_b"));
  EXPECT_EQ(child.getParent().getParent(), hv::logging::getLogger("tree_a"));
}

TEST(LoggerTest, LevelFiltersMessages) {
  auto logger = hv::logging::getLogger("level_filter");
  auto spCapture = std::make_shared<CaptureHandler>();
  logger.addHandler(spCapture);
  logger.setPropagate(false);
  logger.setLevel(hv::logging::Level::WARNING);

  logger.debug << "dropped";
  logger.info << "dropped";
  logger.warning << "kept " << 1;
  logger.error << "kept " << 2;

  ASSERT_EQ(spCapture->records.size(), 2u);
  EXPECT_EQ(spCapture->records[0].level, hv::logging::Level::WARNING);
  EXPECT_NE(spCapture->records[0].message.find("kept 1"), std::string::npos);
  EXPECT_NE(spCapture->records[1].message.find("[ERROR]"), std::string::npos);
}

TEST(LoggerTest, MessagesPropagateToParentWithOriginName) {
  auto parent = hv::logging::getLogger("prop_parent");
  auto child = hv::logging::getLogger("prop_parent.child");
  auto spCapture = std::make_shared<CaptureHandler>();
  parent.addHandler(spCapture);
  parent.setPropagate(false);

  child.info << "from child";

  ASSERT_EQ(spCapture->records.size(), 1u);
  EXPECT_EQ(spCapture->records[0].loggerName, "prop_parent.child");
}

TEST(LoggerTest, RedirectMovesLoggerUnderTarget) {
  auto source = hv::logging::getLogger("redirect_source");
  auto target = hv::logging::getLogger("redirect_target");
  auto spCapture = std::make_shared<CaptureHandler>();
  target.addHandler(spCapture);
  target.setPropagate(false);

  source.redirectTo("redirect_target");
  EXPECT_EQ(source.getParent(), target);
  EXPECT_EQ(source.getFullName(), "redirect_target.redirect_source");

  source.info << "redirected";
  ASSERT_EQ(spCapture->records.size(), 1u);
}

TEST(LoggerTest, PreventCircularRedirection) {
  auto parent = hv::logging::getLogger("circ_parent");
  auto child = hv::logging::getLogger("circ_parent.child");
  EXPECT_THROW(parent.redirectTo("circ_parent.child"), std::invalid_argument);
  EXPECT_THROW(child.redirectTo("circ_parent.child"), std::invalid_argument);
}

TEST(LoggerTest, ParseLevelAcceptsKnownNames) {
  hv::logging::Level level = hv::logging::Level::INFO;
  EXPECT_TRUE(hv::logging::parseLevel("debug", level));
  EXPECT_EQ(level, hv::logging::Level::DEBUG);
  EXPECT_TRUE(hv::logging::parseLevel("WARN", level));
  EXPECT_EQ(level, hv::logging::Level::WARNING);
  EXPECT_FALSE(hv::logging::parseLevel("verbose", level));
  EXPECT_EQ(level, hv::logging::Level::WARNING);
  EXPECT_EQ(hv::logging::levelToString(hv::logging::Level::CRITICAL),
            "CRITICAL");
}

TEST(LoggerTest, FileHandlerWritesMessages) {
  std::string path = "/tmp/hashvote-logger-test.log";
  std::remove(path.c_str());
  {
    auto logger = hv::logging::getLogger("file_handler_test");
    logger.setPropagate(false);
    logger.addFileHandler(path, hv::logging::Level::INFO);
    logger.debug << "not written";
    logger.info << "written to file";
  }
  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("written to file"), std::string::npos);
  EXPECT_EQ(content.find("not written"), std::string::npos);
}
