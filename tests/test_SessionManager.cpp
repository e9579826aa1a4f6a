/**
 * SessionManager: independent sessions over one shared catalog, abort
 * semantics and cleanup.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>

#include "session/SessionManager.h"
#include "tools/BuiltinTools.h"
#include "tools/ToolRegistry.h"

using namespace std::chrono_literals;
using nlohmann::json;

namespace {
std::optional<Envelope> nextReply(Session& session, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto env = session.output().receiveFor(50ms);
    if (env && env->isReply()) return env;
    if (!env && session.output().isDrained()) break;
  }
  return std::nullopt;
}

void initialize(Session& session) {
  ASSERT_TRUE(session.input().send(makeRequest(0, "initialize", {{"protocolVersion", "1.0"}})));
  auto reply = nextReply(session);
  ASSERT_TRUE(reply.has_value());
  ASSERT_EQ(reply->kind, EnvelopeKind::Response);
}
} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::vector<ToolDefinition> defs = BuiltinTools::all(caps);
    ToolDefinition boom;
    boom.descriptor.name = "boom";
    boom.descriptor.description = "always throws";
    boom.handler = [](const json&, const CallContext&) -> ToolResult { throw std::runtime_error("kaput"); };
    defs.push_back(boom);

    ToolDefinition wait;
    wait.descriptor.name = "wait";
    wait.descriptor.description = "runs until stopped";
    wait.handler = [this](const json&, const CallContext& ctx) {
      while (!ctx.shouldStop()) std::this_thread::sleep_for(5ms);
      stopped++;
      return ToolResult::text("stopped");
    };
    defs.push_back(wait);

    registry = std::make_unique<ToolRegistry>(std::move(defs), caps, 4);
    options.queueCapacity = 32;
    options.core.pollInterval = 20ms;
    options.core.drainGrace = 2000ms;
    manager = std::make_unique<SessionManager>(*registry, caps, options);
  }

  void TearDown() override {
    manager->shutdown();
  }

  ServerCapabilities caps;
  SessionOptions options;
  std::unique_ptr<ToolRegistry> registry;
  std::unique_ptr<SessionManager> manager;
  std::atomic<int> stopped{0};
};

TEST_F(SessionManagerTest, OpenAssignsDistinctIdsAndFinds) {
  auto a = manager->open(TransportKind::Stdio);
  auto b = manager->open(TransportKind::Sse);
  ASSERT_TRUE(a && b);
  EXPECT_NE(a->getId(), b->getId());
  EXPECT_EQ(a->getId().size(), 32u);
  EXPECT_EQ(manager->find(a->getId()), a);
  EXPECT_EQ(manager->find("nope"), nullptr);
  EXPECT_EQ(manager->activeCount(), 2u);
}

TEST_F(SessionManagerTest, FaultInOneSessionDoesNotDisturbAnother) {
  auto a = manager->open(TransportKind::Sse);
  auto b = manager->open(TransportKind::Sse);
  initialize(*a);
  initialize(*b);

  ASSERT_TRUE(b->input().send(makeRequest("b1", "tools/call", {{"name", "echo"}, {"arguments", {{"text", "still here"}}}})));
  ASSERT_TRUE(a->input().send(makeRequest("a1", "tools/call", {{"name", "boom"}})));

  auto aReply = nextReply(*a);
  auto bReply = nextReply(*b);
  ASSERT_TRUE(aReply && bReply);
  EXPECT_EQ(aReply->kind, EnvelopeKind::ErrorResponse);
  EXPECT_EQ(aReply->payload["code"], static_cast<int>(ErrorCode::InternalError));
  EXPECT_EQ(bReply->kind, EnvelopeKind::Response);
  EXPECT_EQ(bReply->payload["content"][0]["text"], "still here");

  // Session a keeps working after the fault.
  ASSERT_TRUE(a->input().send(makeRequest("a2", "ping")));
  auto ping = nextReply(*a);
  ASSERT_TRUE(ping.has_value());
  EXPECT_EQ(ping->kind, EnvelopeKind::Response);
}

TEST_F(SessionManagerTest, AbortCancelsOnlyThatSessionsCalls) {
  auto a = manager->open(TransportKind::Sse);
  auto b = manager->open(TransportKind::Sse);
  initialize(*a);
  initialize(*b);

  ASSERT_TRUE(a->input().send(makeRequest(1, "tools/call", {{"name", "wait"}})));
  ASSERT_TRUE(b->input().send(makeRequest(1, "tools/call", {{"name", "wait"}, {"_meta", {{"timeoutMs", 400}}}})));
  std::this_thread::sleep_for(50ms);

  manager->abort(a->getId());
  EXPECT_TRUE(a->waitFinished(1000ms));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(stopped.load(), 1);

  // b's call is untouched and ends on its own deadline.
  auto bReply = nextReply(*b);
  ASSERT_TRUE(bReply.has_value());
  EXPECT_EQ(bReply->payload["code"], static_cast<int>(ErrorCode::Timeout));
}

TEST_F(SessionManagerTest, ClosedSessionFinishesAndIsForgotten) {
  auto a = manager->open(TransportKind::Stdio);
  std::string id = a->getId();
  manager->close(id);
  EXPECT_TRUE(a->waitFinished(1000ms));
  EXPECT_TRUE(a->output().isDrained());
  EXPECT_EQ(manager->find(id), nullptr);
  EXPECT_EQ(manager->activeCount(), 0u);
}

TEST_F(SessionManagerTest, ShutdownClosesEverythingAndRefusesNewSessions) {
  auto a = manager->open(TransportKind::Stdio);
  auto b = manager->open(TransportKind::Sse);
  manager->shutdown();
  EXPECT_TRUE(a->isFinished());
  EXPECT_TRUE(b->isFinished());
  EXPECT_EQ(manager->open(TransportKind::Stdio), nullptr);
}

TEST(SessionManagerIdle, IdleSessionIsClosed) {
  ServerCapabilities caps;
  ToolRegistry registry(BuiltinTools::all(caps), caps, 1);
  SessionOptions options;
  options.idleTimeout = 200ms;
  options.core.pollInterval = 20ms;
  SessionManager manager(registry, caps, options);

  auto s = manager.open(TransportKind::Sse);
  // The idle monitor ticks every 500ms.
  EXPECT_TRUE(s->waitFinished(3000ms));
}
