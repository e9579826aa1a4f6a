/**
 * GatewayAggregator over scripted backends: merge order, collisions and
 * qualified names, omission and reconnection of failed backends, the
 * status tools and argument validation before forwarding. Also covers
 * the reply mapping in RpcBackendClient through a loopback subclass.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "gateway/GatewayAggregator.h"
#include "gateway/RpcBackendClient.h"
#include "utils/Logger.h"

using namespace std::chrono_literals;
using nlohmann::json;

namespace {
// What one scripted backend does; shared between the test and every client the factory creates.
struct BackendScript {
  std::atomic<bool> reachable{true};
  std::atomic<bool> connected{true};
  std::vector<ToolDescriptor> tools;
  std::vector<std::pair<std::string, json>> calls;
  std::atomic<int> connects{0};
  json info = {{"name", "fake"}, {"version", "0.1"}};
};

class ScriptedBackend : public IBackendClient {
public:
  ScriptedBackend(std::string name, std::shared_ptr<BackendScript> script)
    : name(std::move(name)), script(std::move(script)) {}

  std::string describe() const override { return "scripted: " + name; }

  bool connect(std::chrono::milliseconds) override {
    script->connects++;
    if (!script->reachable) return false;
    script->connected = true;
    return true;
  }

  std::optional<std::vector<ToolDescriptor>> listTools(std::chrono::milliseconds) override {
    if (!script->connected) return std::nullopt;
    return script->tools;
  }

  InvocationOutcome callTool(const std::string& tool, const json& arguments, const CallContext&) override {
    script->calls.emplace_back(tool, arguments);
    return InvocationOutcome::success(ToolResult::text(name + ":" + tool));
  }

  bool isConnected() const override { return script->connected; }
  void close() override {}
  json serverInfo() const override { return script->info; }
  std::string lastError() const override { return script->reachable ? "" : "connection refused"; }

private:
  std::string name;
  std::shared_ptr<BackendScript> script;
};

ToolDescriptor tool(const std::string& name, json schema = json()) {
  ToolDescriptor d;
  d.name = name;
  d.description = "tool " + name;
  if (!schema.is_null()) d.inputSchema = schema;
  return d;
}

Config::BackendConfig backend(const std::string& name) {
  Config::BackendConfig config;
  config.name = name;
  config.command = "/bin/" + name;
  return config;
}

CallContext contextWithin(std::chrono::milliseconds timeout) {
  CallContext ctx;
  ctx.correlationId = 1;
  ctx.deadline = std::chrono::steady_clock::now() + timeout;
  return ctx;
}

std::vector<std::string> namesOf(const std::vector<ToolDescriptor>& tools) {
  std::vector<std::string> names;
  for (const auto& t : tools) names.push_back(t.name);
  return names;
}

std::string textOf(const InvocationOutcome& outcome) {
  return outcome.result->content[0]["text"].get<std::string>();
}
} // namespace

class GatewayAggregatorTest : public ::testing::Test {
protected:
  std::shared_ptr<BackendScript> script(const std::string& name) {
    auto& s = scripts[name];
    if (!s) s = std::make_shared<BackendScript>();
    return s;
  }

  std::unique_ptr<GatewayAggregator> makeGateway(std::vector<Config::BackendConfig> backends) {
    GatewayOptions options;
    options.reconnectInterval = reconnectInterval;
    options.workerThreads = 2;
    auto factory = [this](const Config::BackendConfig& config) -> std::unique_ptr<IBackendClient> {
      return std::make_unique<ScriptedBackend>(config.name, script(config.name));
    };
    return std::make_unique<GatewayAggregator>(std::move(backends), caps, options, factory);
  }

  ServerCapabilities caps;
  std::chrono::milliseconds reconnectInterval{60000};
  std::map<std::string, std::shared_ptr<BackendScript>> scripts;
};

TEST_F(GatewayAggregatorTest, MergesInConfigurationOrderAfterLocalTools) {
  script("a")->tools = {tool("read"), tool("write")};
  script("b")->tools = {tool("search")};
  auto gateway = makeGateway({backend("a"), backend("b")});
  gateway->refresh();

  std::vector<std::string> expected{"health_check", "list_servers", "get_server_info", "read", "write", "search"};
  EXPECT_EQ(namesOf(gateway->listTools()), expected);
  // Same inputs, same listing.
  EXPECT_EQ(namesOf(gateway->listTools()), expected);

  auto tools = gateway->listTools();
  EXPECT_EQ(tools[3].meta["backend"], "a");
  EXPECT_EQ(tools[5].meta["backend"], "b");
}

TEST_F(GatewayAggregatorTest, FirstRegisteredWinsAndQualifiedNameStillRoutes) {
  script("a")->tools = {tool("search")};
  script("b")->tools = {tool("search"), tool("health_check")};
  auto gateway = makeGateway({backend("a"), backend("b")});
  gateway->refresh();

  auto names = namesOf(gateway->listTools());
  EXPECT_EQ(std::count(names.begin(), names.end(), "search"), 1);
  EXPECT_EQ(std::count(names.begin(), names.end(), "health_check"), 1);

  auto plain = gateway->invoke("search", json::object(), contextWithin(1s));
  ASSERT_TRUE(plain.ok());
  EXPECT_EQ(textOf(plain), "a:search");

  auto qualified = gateway->invoke("b.search", json::object(), contextWithin(1s));
  ASSERT_TRUE(qualified.ok());
  EXPECT_EQ(textOf(qualified), "b:search");

  // The local health_check shadows the backend's.
  auto health = gateway->invoke("health_check", json::object(), contextWithin(1s));
  ASSERT_TRUE(health.ok());
  EXPECT_EQ(script("b")->calls.size(), 1u);

  auto backendHealth = gateway->invoke("b.health_check", json::object(), contextWithin(1s));
  ASSERT_TRUE(backendHealth.ok());
  EXPECT_EQ(textOf(backendHealth), "b:health_check");
}

TEST_F(GatewayAggregatorTest, CollisionIsLoggedOnce) {
  std::mutex logMutex;
  std::vector<std::string> warnings;
  Logger::getInstance().setCallback([&](LogLevel level, const std::string& message) {
    if (level != LogLevel::WARNING) return;
    std::lock_guard<std::mutex> lock(logMutex);
    warnings.push_back(message);
  });

  script("a")->tools = {tool("search")};
  script("b")->tools = {tool("search")};
  auto gateway = makeGateway({backend("a"), backend("b")});
  gateway->refresh();
  gateway->refresh();
  Logger::getInstance().setCallback(nullptr);

  std::lock_guard<std::mutex> lock(logMutex);
  auto mentions = std::count_if(warnings.begin(), warnings.end(), [](const std::string& w) {
    return w.find("b.search") != std::string::npos;
  });
  EXPECT_EQ(mentions, 1);
}

TEST_F(GatewayAggregatorTest, UnreachableBackendIsOmitted) {
  script("a")->tools = {tool("read")};
  script("down")->reachable = false;
  script("down")->tools = {tool("hidden")};
  auto gateway = makeGateway({backend("a"), backend("down")});
  gateway->refresh();

  auto names = namesOf(gateway->listTools());
  EXPECT_NE(std::find(names.begin(), names.end(), "read"), names.end());
  EXPECT_EQ(std::find(names.begin(), names.end(), "hidden"), names.end());

  auto outcome = gateway->invoke("hidden", json::object(), contextWithin(1s));
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code, ErrorCode::ToolNotFound);

  json rows = gateway->listServers();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_TRUE(rows[0]["connected"].get<bool>());
  EXPECT_FALSE(rows[1]["connected"].get<bool>());
  EXPECT_EQ(rows[1]["error"], "connection refused");
}

TEST_F(GatewayAggregatorTest, ReconnectsOnTheRetryIntervalAndBumpsGeneration) {
  reconnectInterval = 200ms;
  script("late")->reachable = false;
  script("late")->tools = {tool("arrive")};
  auto gateway = makeGateway({backend("late")});
  gateway->refresh();
  uint64_t before = gateway->generation();
  EXPECT_EQ(script("late")->connects.load(), 1);

  // Inside the interval no new attempt is made.
  gateway->refresh();
  EXPECT_EQ(script("late")->connects.load(), 1);

  script("late")->reachable = true;
  std::this_thread::sleep_for(250ms);
  gateway->refresh();
  EXPECT_EQ(script("late")->connects.load(), 2);

  auto names = namesOf(gateway->listTools());
  EXPECT_NE(std::find(names.begin(), names.end(), "arrive"), names.end());
  EXPECT_GT(gateway->generation(), before);

  // A backend that drops out disappears again and the generation moves.
  uint64_t connected = gateway->generation();
  script("late")->connected = false;
  script("late")->reachable = false;
  gateway->refresh();
  names = namesOf(gateway->listTools());
  EXPECT_EQ(std::find(names.begin(), names.end(), "arrive"), names.end());
  EXPECT_GT(gateway->generation(), connected);
}

TEST_F(GatewayAggregatorTest, UnchangedListingKeepsGeneration) {
  script("a")->tools = {tool("read")};
  auto gateway = makeGateway({backend("a")});
  gateway->refresh();
  uint64_t g = gateway->generation();
  gateway->refresh();
  gateway->refresh();
  EXPECT_EQ(gateway->generation(), g);
}

TEST_F(GatewayAggregatorTest, ValidatesBeforeForwarding) {
  json schema = {
    {"type", "object"},
    {"properties", {{"path", {{"type", "string"}}}, {"limit", {{"type", "integer"}, {"default", 10}}}}},
    {"required", {"path"}}
  };
  auto strict = tool("read", schema);
  strict.defaults = {{"limit", 10}};
  script("a")->tools = {strict};
  auto gateway = makeGateway({backend("a")});
  gateway->refresh();

  auto bad = gateway->invoke("read", {{"path", 5}}, contextWithin(1s));
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(bad.error->code, ErrorCode::ValidationError);
  EXPECT_TRUE(script("a")->calls.empty());

  auto notObject = gateway->invoke("read", json::array(), contextWithin(1s));
  ASSERT_FALSE(notObject.ok());
  EXPECT_EQ(notObject.error->code, ErrorCode::InvalidParams);
  EXPECT_TRUE(script("a")->calls.empty());

  auto good = gateway->invoke("read", {{"path", "/tmp"}}, contextWithin(1s));
  ASSERT_TRUE(good.ok());
  ASSERT_EQ(script("a")->calls.size(), 1u);
  EXPECT_EQ(script("a")->calls[0].second["path"], "/tmp");
  EXPECT_EQ(script("a")->calls[0].second["limit"], 10);
}

TEST_F(GatewayAggregatorTest, CancelledCallIsNotForwarded) {
  script("a")->tools = {tool("read")};
  auto gateway = makeGateway({backend("a")});
  gateway->refresh();

  auto ctx = contextWithin(1s);
  ctx.cancel->cancel();
  auto outcome = gateway->invoke("read", json::object(), ctx);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code, ErrorCode::Cancelled);
  EXPECT_TRUE(script("a")->calls.empty());
}

TEST_F(GatewayAggregatorTest, StatusTools) {
  script("a")->tools = {tool("read")};
  auto gateway = makeGateway({backend("a")});
  gateway->refresh();

  auto list = gateway->invoke("list_servers", json::object(), contextWithin(1s));
  ASSERT_TRUE(list.ok());
  json rows = json::parse(textOf(list));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0]["name"], "a");
  EXPECT_EQ(rows[0]["kind"], "process");
  EXPECT_EQ(rows[0]["target"], "/bin/a");
  EXPECT_EQ(rows[0]["tools"], 1);

  auto info = gateway->invoke("get_server_info", {{"server_name", "a"}}, contextWithin(1s));
  ASSERT_TRUE(info.ok());
  json detail = json::parse(textOf(info));
  EXPECT_EQ(detail["serverInfo"]["name"], "fake");
  EXPECT_EQ(detail["tools"], json::array({"read"}));

  auto missing = gateway->invoke("get_server_info", {{"server_name", "nope"}}, contextWithin(1s));
  ASSERT_TRUE(missing.ok());
  EXPECT_TRUE(missing.result->isError);
  EXPECT_EQ(textOf(missing), "Server nope not found");

  auto invalid = gateway->invoke("get_server_info", json::object(), contextWithin(1s));
  ASSERT_FALSE(invalid.ok());
  EXPECT_EQ(invalid.error->code, ErrorCode::ValidationError);
}

TEST_F(GatewayAggregatorTest, BackgroundRefreshPicksUpBackends) {
  reconnectInterval = 20ms;
  script("a")->reachable = false;
  script("a")->tools = {tool("read")};
  auto gateway = makeGateway({backend("a")});
  gateway->start();
  script("a")->reachable = true;

  bool seen = false;
  for (int i = 0; i < 100 && !seen; ++i) {
    auto names = namesOf(gateway->listTools());
    seen = std::find(names.begin(), names.end(), "read") != names.end();
    if (!seen) std::this_thread::sleep_for(10ms);
  }
  gateway->stop();
  EXPECT_TRUE(seen);
}

namespace {
// Answers every request synchronously through a scripted responder.
class LoopbackClient : public RpcBackendClient {
public:
  using Responder = std::function<std::optional<Envelope>(const Envelope&)>;

  explicit LoopbackClient(Responder responder) : RpcBackendClient(loopbackOptions()), responder(std::move(responder)) {}

  std::string describe() const override { return "loopback"; }
  bool connect(std::chrono::milliseconds timeout) override {
    up = true;
    if (!handshake(timeout)) {
      up = false;
      return false;
    }
    return true;
  }
  bool isConnected() const override { return up; }
  void close() override {
    up = false;
    failPending("closed");
  }

  std::vector<Envelope> sent() {
    std::lock_guard<std::mutex> lock(sentMutex);
    return log;
  }

protected:
  bool sendEnvelope(const Envelope& envelope) override {
    {
      std::lock_guard<std::mutex> lock(sentMutex);
      log.push_back(envelope);
    }
    if (!envelope.isRequest()) return true;
    if (auto reply = responder(envelope)) deliver(*reply);
    return true;
  }

private:
  static BackendOptions loopbackOptions() {
    BackendOptions o;
    o.name = "loop";
    return o;
  }

  Responder responder;
  bool up = false;
  std::mutex sentMutex;
  std::vector<Envelope> log;
};

std::optional<Envelope> standardReplies(const Envelope& request) {
  if (request.method == "initialize") {
    return makeResponse(request.id, {{"protocolVersion", "2025-06-18"},
                                     {"serverInfo", {{"name", "loop-server"}, {"version", "2"}}},
                                     {"capabilities", json::object()}});
  }
  if (request.method == "tools/list") {
    return makeResponse(request.id, {{"tools", json::array({
      {{"name", "add"}, {"description", "add numbers"}, {"inputSchema", {{"type", "object"}}}}
    })}});
  }
  return std::nullopt;
}
} // namespace

TEST(RpcBackendClient, HandshakeAndListing) {
  LoopbackClient client(standardReplies);
  ASSERT_TRUE(client.connect(1s));
  EXPECT_EQ(client.serverInfo()["name"], "loop-server");
  EXPECT_EQ(client.serverInfo()["protocolVersion"], "2025-06-18");

  auto sent = client.sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].method, "initialize");
  EXPECT_EQ(sent[0].payload["clientInfo"]["name"], "switchboard");
  EXPECT_EQ(sent[1].method, "notifications/initialized");

  auto tools = client.listTools(1s);
  ASSERT_TRUE(tools);
  ASSERT_EQ(tools->size(), 1u);
  EXPECT_EQ((*tools)[0].name, "add");
}

TEST(RpcBackendClient, BackendErrorBecomesToolError) {
  LoopbackClient client([](const Envelope& request) -> std::optional<Envelope> {
    if (request.method != "tools/call") return standardReplies(request);
    Envelope error;
    error.id = request.id;
    error.kind = EnvelopeKind::ErrorResponse;
    error.payload = {{"code", -32000}, {"message", "disk full"}, {"data", {{"free", 0}}}};
    return error;
  });
  ASSERT_TRUE(client.connect(1s));

  auto outcome = client.callTool("add", json::object(), contextWithin(1s));
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code, ErrorCode::ToolError);
  EXPECT_EQ(outcome.error->data["backend"], "loop");
  EXPECT_EQ(outcome.error->data["tool"], "add");
  EXPECT_EQ(outcome.error->data["backendCode"], -32000);
  EXPECT_EQ(outcome.error->data["backendData"]["free"], 0);
}

TEST(RpcBackendClient, ResultIsPassedThrough) {
  LoopbackClient client([](const Envelope& request) -> std::optional<Envelope> {
    if (request.method != "tools/call") return standardReplies(request);
    return makeResponse(request.id, {{"content", json::array({{{"type", "text"}, {"text", "3"}}})},
                                     {"isError", false}});
  });
  ASSERT_TRUE(client.connect(1s));

  auto outcome = client.callTool("add", {{"a", 1}, {"b", 2}}, contextWithin(1s));
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(textOf(outcome), "3");
}

TEST(RpcBackendClient, SilentBackendTimesOutAndIsToldToCancel) {
  LoopbackClient client(standardReplies);
  ASSERT_TRUE(client.connect(1s));

  auto outcome = client.callTool("add", json::object(), contextWithin(60ms));
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code, ErrorCode::Timeout);

  auto sent = client.sent();
  ASSERT_FALSE(sent.empty());
  EXPECT_EQ(sent.back().method, "notifications/cancelled");
  EXPECT_EQ(sent.back().payload["reason"], "timeout");
}

TEST(RpcBackendClient, CancelledCallStopsWaiting) {
  LoopbackClient client(standardReplies);
  ASSERT_TRUE(client.connect(1s));

  auto ctx = contextWithin(5s);
  std::thread canceller([token = ctx.cancel] {
    std::this_thread::sleep_for(50ms);
    token->cancel();
  });
  auto started = std::chrono::steady_clock::now();
  auto outcome = client.callTool("add", json::object(), ctx);
  canceller.join();

  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code, ErrorCode::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(RpcBackendClient, RejectedHandshakeFailsConnect) {
  LoopbackClient client([](const Envelope& request) -> std::optional<Envelope> {
    return makeErrorResponse(request.id, ErrorCode::InvalidParams, "Unsupported protocol version");
  });
  EXPECT_FALSE(client.connect(1s));
  EXPECT_NE(client.lastError().find("Unsupported protocol version"), std::string::npos);
}
