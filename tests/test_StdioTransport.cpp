/**
 * StdioTransport over a pair of pipes: the full client scenario including
 * recovery from a malformed line, and clean shutdown on end of input.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "session/SessionManager.h"
#include "tools/BuiltinTools.h"
#include "tools/ToolRegistry.h"
#include "transport/LineBuffer.h"
#include "transport/StdioTransport.h"

using namespace std::chrono_literals;
using nlohmann::json;

TEST(LineBuffer, SplitsChunksIntoLines) {
  LineBuffer buf;
  auto lines = buf.append("ab", 2);
  EXPECT_TRUE(lines.empty());
  std::string rest = "c\r\nde\nf";
  lines = buf.append(rest.data(), rest.size());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "abc");
  EXPECT_EQ(lines[1], "de");
  EXPECT_EQ(buf.takeRemainder(), "f");
}

TEST(LineBuffer, DropsOversizedLine) {
  LineBuffer buf(4);
  std::string data = "toolongline";
  EXPECT_TRUE(buf.append(data.data(), data.size()).empty());
  EXPECT_EQ(buf.overflowed(), 1u);
  std::string tail = "still\nok\n";
  auto lines = buf.append(tail.data(), tail.size());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "ok");
}

class StdioTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_EQ(pipe(toServer), 0);
    ASSERT_EQ(pipe(toClient), 0);
    registry = std::make_unique<ToolRegistry>(BuiltinTools::all(caps), caps, 2);
    SessionOptions options;
    options.core.pollInterval = 20ms;
    sessions = std::make_unique<SessionManager>(*registry, caps, options);
    transport = std::make_unique<StdioTransport>(*sessions, toServer[0], toClient[1]);
    ASSERT_TRUE(transport->start());
    runner = std::thread([this] { transport->run(); });
  }

  void TearDown() override {
    closeInput();
    if (runner.joinable()) runner.join();
    transport.reset();
    sessions->shutdown();
    ::close(toServer[0]);
    ::close(toClient[0]);
    ::close(toClient[1]);
  }

  void closeInput() {
    if (toServer[1] >= 0) {
      ::close(toServer[1]);
      toServer[1] = -1;
    }
  }

  void writeLine(const std::string& line) {
    std::string data = line + "\n";
    ASSERT_EQ(write(toServer[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
  }

  // Next line the server wrote, or empty on timeout.
  std::string readLine(std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pendingLines.empty()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) return "";
      pollfd pfd{toClient[0], POLLIN, 0};
      if (poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return "";
      char buf[4096];
      ssize_t n = read(toClient[0], buf, sizeof(buf));
      if (n <= 0) return "";
      for (auto& line : reader.append(buf, static_cast<size_t>(n))) pendingLines.push_back(line);
    }
    std::string line = pendingLines.front();
    pendingLines.erase(pendingLines.begin());
    return line;
  }

  json call(const json& request) {
    writeLine(request.dump());
    std::string line = readLine();
    EXPECT_FALSE(line.empty()) << "no reply to " << request.dump();
    return line.empty() ? json() : json::parse(line);
  }

  int toServer[2] = {-1, -1};
  int toClient[2] = {-1, -1};
  ServerCapabilities caps;
  std::unique_ptr<ToolRegistry> registry;
  std::unique_ptr<SessionManager> sessions;
  std::unique_ptr<StdioTransport> transport;
  std::thread runner;
  LineBuffer reader;
  std::vector<std::string> pendingLines;
};

TEST_F(StdioTransportTest, ClientScenarioSurvivesMalformedLine) {
  json init = call({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", {{"protocolVersion", "1.0"}}}});
  ASSERT_TRUE(init.contains("result")) << init.dump();
  EXPECT_EQ(init["result"]["protocolVersion"], "1.0");
  writeLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

  json list = call({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
  ASSERT_TRUE(list.contains("result")) << list.dump();
  bool hasHealth = false;
  for (const auto& tool : list["result"]["tools"]) {
    if (tool["name"] == "health_check") hasHealth = true;
  }
  EXPECT_TRUE(hasHealth);

  json health = call({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"}, {"params", {{"name", "health_check"}}}});
  ASSERT_TRUE(health.contains("result")) << health.dump();
  EXPECT_FALSE(health["result"]["isError"].get<bool>());
  EXPECT_EQ(health["result"]["content"][0]["type"], "text");

  writeLine("{this is not json");
  std::string errLine = readLine();
  ASSERT_FALSE(errLine.empty());
  json err = json::parse(errLine);
  EXPECT_TRUE(err["id"].is_null());
  EXPECT_EQ(err["error"]["code"], static_cast<int>(ErrorCode::ParseError));

  json echo = call({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                    {"params", {{"name", "echo"}, {"arguments", {{"text", "after"}}}}}});
  ASSERT_TRUE(echo.contains("result")) << echo.dump();
  EXPECT_EQ(echo["result"]["content"][0]["text"], "after");
}

TEST_F(StdioTransportTest, BlankLinesAreIgnoredAndCrlfAccepted) {
  writeLine("");
  writeLine("   ");
  std::string data = R"({"jsonrpc":"2.0","id":"p","method":"ping"})" "\r\n";
  ASSERT_EQ(write(toServer[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
  std::string line = readLine();
  ASSERT_FALSE(line.empty());
  json reply = json::parse(line);
  EXPECT_EQ(reply["id"], "p");
  EXPECT_TRUE(reply.contains("result"));
}

TEST_F(StdioTransportTest, EndOfInputEndsTheSession) {
  auto session = transport->getSession();
  ASSERT_TRUE(session);
  closeInput();
  runner.join();
  EXPECT_TRUE(session->isFinished());
}
