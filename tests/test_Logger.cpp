/**
 * Logger: level filtering, file output and the callback hook.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "utils/Logger.h"

using namespace std::chrono_literals;

class LoggerTest : public ::testing::Test {
protected:
  void TearDown() override {
    Logger::getInstance().setCallback(nullptr);
    Logger::getInstance().setLevel(LogLevel::INFO);
    Logger::getInstance().setLogFile("");
  }
};

TEST_F(LoggerTest, CallbackMayLogWithoutDeadlock) {
  std::mutex seenMutex;
  std::vector<std::string> seen;
  Logger::getInstance().setCallback([&](LogLevel, const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(seenMutex);
      seen.push_back(message);
    }
    if (message == "outer") Logger::getInstance().info("inner");
  });

  auto finished = std::make_shared<std::promise<void>>();
  auto done = finished->get_future();
  // Detached so a deadlock fails the test instead of hanging it.
  std::thread([finished] {
    Logger::getInstance().info("outer");
    finished->set_value();
  }).detach();
  ASSERT_EQ(done.wait_for(2s), std::future_status::ready);

  std::lock_guard<std::mutex> lock(seenMutex);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "outer");
  EXPECT_EQ(seen[1], "inner");
}

TEST_F(LoggerTest, LevelFilterAppliesToCallback) {
  std::vector<LogLevel> levels;
  Logger::getInstance().setCallback([&](LogLevel level, const std::string&) { levels.push_back(level); });
  Logger::getInstance().setLevel(LogLevel::WARNING);

  Logger::getInstance().debug("d");
  Logger::getInstance().info("i");
  Logger::getInstance().warn("w");
  Logger::getInstance().error("e");

  ASSERT_EQ(levels.size(), 2u);
  EXPECT_EQ(levels[0], LogLevel::WARNING);
  EXPECT_EQ(levels[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, AppendsToLogFile) {
  char path[] = "/tmp/switchboard_log_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(fd, -1);
  close(fd);

  Logger::getInstance().setLogFile(path);
  Logger::getInstance().warn("disk nearly full");
  Logger::getInstance().setLogFile("");

  std::ifstream in(path);
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_NE(contents.str().find("[WARN] disk nearly full"), std::string::npos) << contents.str();
  std::remove(path);
}

TEST(LoggerLevels, ParseLevelNames) {
  LogLevel level = LogLevel::INFO;
  EXPECT_TRUE(Logger::parseLevel("debug", level));
  EXPECT_EQ(level, LogLevel::DEBUG);
  EXPECT_TRUE(Logger::parseLevel("WARN", level));
  EXPECT_EQ(level, LogLevel::WARNING);
  EXPECT_FALSE(Logger::parseLevel("verbose", level));
}
