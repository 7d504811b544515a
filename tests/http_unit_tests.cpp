#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "clock/time_service.hpp"
#include "http/api_keys.hpp"
#include "http/http_server.hpp"
#include "http/router.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/tools.hpp"
#include "sinks/health_exporter.hpp"
#include "sync/sync_monitor.hpp"

namespace beast_http = boost::beast::http;

using utc_time::http::ApiKey;
using utc_time::http::ApiKeyValidator;
using utc_time::http::HttpServer;
using utc_time::http::HttpServerOptions;
using utc_time::http::Request;
using utc_time::http::Response;
using utc_time::http::Router;
using utc_time::http::RouterOptions;
using utc_time::mcp::Dispatcher;
using utc_time::mcp::ToolContext;
using utc_time::sinks::HealthExporter;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Dispatcher, exporter and router wired the way main does, without a monitor.
struct Fixture {
  explicit Fixture(ApiKeyValidator keys = {}, RouterOptions options = {})
      : dispatcher(utc_time::mcp::build_registry(context), context),
        exporter(nullptr, std::chrono::milliseconds(100)),
        router(dispatcher, exporter, std::move(keys), options) {}

  ToolContext context{};
  Dispatcher dispatcher;
  HealthExporter exporter;
  Router router;
};

Request make_request(const beast_http::verb verb, const std::string& target, const std::string& body = {}) {
  Request request{verb, target, 11};
  request.set(beast_http::field::host, "localhost");
  if (!body.empty()) {
    request.set(beast_http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
  }
  return request;
}

nlohmann::json body_json(const Response& response) { return nlohmann::json::parse(response.body()); }

bool has_cors(const Response& response) {
  const auto origin = response[beast_http::field::access_control_allow_origin];
  return std::string(origin.data(), origin.size()) == "*";
}

int test_health_and_metrics_routes() {
  const Fixture fixture;

  const auto health = fixture.router.handle(make_request(beast_http::verb::get, "/health"));
  if (health.result() != beast_http::status::ok || !has_cors(health)) {
    return fail("test_health_and_metrics_routes", "/health should answer 200 with CORS");
  }
  const auto doc = body_json(health);
  if (doc["status"] != "degraded" || doc["service"] != "mcp-utc-time-server" || doc["sync"]["available"] != false ||
      doc["sync"]["source"] != "Unavailable") {
    return fail("test_health_and_metrics_routes", "health document should degrade without a sync source");
  }

  const auto metrics = fixture.router.handle(make_request(beast_http::verb::get, "/metrics"));
  if (metrics.result() != beast_http::status::ok) {
    return fail("test_health_and_metrics_routes", "/metrics should answer 200");
  }

  const auto& text = metrics.body();
  for (const char* needle : {"# TYPE mcp_time_seconds gauge\n", "mcp_ntp_available 0\n", "mcp_ntp_synced 0\n",
                             "mcp_ntp_source{source=\"Unavailable\"} 1\n", "mcp_build_info{version=\"0.1.0\"} 1\n"}) {
    if (text.find(needle) == std::string::npos) {
      return fail("test_health_and_metrics_routes", "metrics line missing");
    }
  }

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto space = line.rfind(' ');
    if (space == std::string::npos || space == 0 || space + 1 == line.size()) {
      return fail("test_health_and_metrics_routes", "sample line must be '<name> <value>'");
    }
  }
  return 0;
}

int test_health_document_states() {
  utc_time::sync::SyncStatus status{};
  status.available = true;
  status.synced = true;
  status.offset_ms = 0.25;
  status.stratum = 2;
  status.source = utc_time::sync::SyncSource::kPeerQuery;

  const utc_time::clock::TimeSnapshot snapshot{.seconds = 1700000000, .nanos = 5};
  const auto doc = utc_time::sinks::build_health_document(snapshot, status);
  if (doc["status"] != "healthy" || doc["timestamp"] != "2023-11-14T22:13:20Z" || doc["sync"]["stratum"] != 2) {
    return fail("test_health_document_states", "synced status should be healthy");
  }

  const auto metrics = utc_time::sinks::render_metrics(snapshot, status);
  if (metrics.find("mcp_time_seconds 1700000000\n") == std::string::npos ||
      metrics.find("mcp_ntp_offset_ms 0.250000\n") == std::string::npos ||
      metrics.find("mcp_ntp_source{source=\"PeerQuery\"} 1\n") == std::string::npos) {
    return fail("test_health_document_states", "metrics should reflect the status");
  }
  return 0;
}

int test_api_routes() {
  const Fixture fixture({}, RouterOptions{.container_mode = true});

  const auto time = fixture.router.handle(make_request(beast_http::verb::get, "/api/time?pretty=1"));
  if (time.result() != beast_http::status::ok || body_json(time)["timezone"] != "UTC") {
    return fail("test_api_routes", "/api/time should return the UTC document");
  }

  const auto nanos = body_json(fixture.router.handle(make_request(beast_http::verb::get, "/api/nanos")));
  if (!nanos.contains("nanoseconds")) {
    return fail("test_api_routes", "/api/nanos payload missing");
  }

  const auto zone = fixture.router.handle(make_request(beast_http::verb::get, "/api/time/timezone/UTC"));
  if (zone.result() != beast_http::status::ok) {
    return fail("test_api_routes", "known zone should answer 200");
  }

  const auto bad_zone = fixture.router.handle(make_request(beast_http::verb::get, "/api/time/timezone/Not%2FAZone"));
  if (bad_zone.result() != beast_http::status::bad_request || !body_json(bad_zone).contains("error")) {
    return fail("test_api_routes", "unknown zone should answer 400");
  }

  const auto status = fixture.router.handle(make_request(beast_http::verb::get, "/api/ntp/status"));
  const auto status_doc = body_json(status);
  if (status_doc["available"] != false || status_doc["container_mode"] != true) {
    return fail("test_api_routes", "ntp status should degrade and report container mode");
  }

  const auto missing = fixture.router.handle(make_request(beast_http::verb::get, "/nope"));
  if (missing.result() != beast_http::status::not_found || !body_json(missing)["available_endpoints"].is_array()) {
    return fail("test_api_routes", "unknown path should answer 404 with endpoint list");
  }

  const auto preflight = fixture.router.handle(make_request(beast_http::verb::options, "/api/time"));
  if (preflight.result() != beast_http::status::no_content || !has_cors(preflight)) {
    return fail("test_api_routes", "OPTIONS should answer 204 with CORS");
  }
  return 0;
}

int test_jsonrpc_over_http() {
  const Fixture fixture;

  const auto listed = fixture.router.handle(
      make_request(beast_http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
  if (listed.result() != beast_http::status::ok || body_json(listed)["result"]["tools"].empty()) {
    return fail("test_jsonrpc_over_http", "tools/list over HTTP should answer 200");
  }

  const auto notification = fixture.router.handle(
      make_request(beast_http::verb::post, "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
  if (notification.result() != beast_http::status::accepted || !notification.body().empty()) {
    return fail("test_jsonrpc_over_http", "notification should answer 202 without a body");
  }

  const auto wrong_verb = fixture.router.handle(make_request(beast_http::verb::get, "/mcp"));
  if (wrong_verb.result() != beast_http::status::method_not_allowed) {
    return fail("test_jsonrpc_over_http", "GET /mcp should be rejected");
  }
  return 0;
}

int test_api_key_enforcement() {
  const Fixture fixture(ApiKeyValidator::from_keys({ApiKey{.key = "secret", .name = "ops"}}));

  if (fixture.router.handle(make_request(beast_http::verb::get, "/api/time")).result() !=
      beast_http::status::unauthorized) {
    return fail("test_api_key_enforcement", "missing key should answer 401");
  }

  auto bearer = make_request(beast_http::verb::get, "/api/time");
  bearer.set(beast_http::field::authorization, "Bearer secret");
  if (fixture.router.handle(bearer).result() != beast_http::status::ok) {
    return fail("test_api_key_enforcement", "bearer token should be accepted");
  }

  auto header = make_request(beast_http::verb::get, "/api/unix");
  header.set("X-API-Key", "secret");
  if (fixture.router.handle(header).result() != beast_http::status::ok) {
    return fail("test_api_key_enforcement", "X-API-Key should be accepted");
  }

  auto wrong = make_request(beast_http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
  wrong.set("X-API-Key", "guess");
  if (fixture.router.handle(wrong).result() != beast_http::status::unauthorized) {
    return fail("test_api_key_enforcement", "wrong key should answer 401");
  }

  if (fixture.router.handle(make_request(beast_http::verb::get, "/health")).result() != beast_http::status::ok ||
      fixture.router.handle(make_request(beast_http::verb::get, "/metrics")).result() != beast_http::status::ok) {
    return fail("test_api_key_enforcement", "health and metrics stay open");
  }
  return 0;
}

int test_api_keys_from_environment() {
  std::vector<std::string> storage = {"API_KEY_OPS=abc", R"(API_KEY_CI={"key":"def","name":"ci-bot"})",
                                      "API_KEYS=x, y", "API_KEY_BAD={oops", "API_KEY_EMPTY=", "PATH=/bin"};
  std::vector<char*> envp;
  for (auto& entry : storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  const auto keys = ApiKeyValidator::from_environment(envp.data());
  if (keys.size() != 4) {
    return fail("test_api_keys_from_environment", "expected four keys");
  }
  if (keys.validate("abc") != "ops" || keys.validate("def") != "ci-bot" || keys.validate("y") != "key_2") {
    return fail("test_api_keys_from_environment", "key names resolved incorrectly");
  }
  if (keys.validate("{oops").has_value() || keys.validate("").has_value()) {
    return fail("test_api_keys_from_environment", "malformed or empty keys must not validate");
  }

  if (utc_time::http::extract_api_key("bearer tok", "other") != "tok" ||
      utc_time::http::extract_api_key("Basic tok", "other") != "other" ||
      utc_time::http::extract_api_key("", "").has_value()) {
    return fail("test_api_keys_from_environment", "credential extraction wrong");
  }
  return 0;
}

int test_percent_decode() {
  if (utc_time::http::percent_decode("America%2FNew_York") != "America/New_York") {
    return fail("test_percent_decode", "escape should decode");
  }
  if (utc_time::http::percent_decode("bad%2").has_value() || utc_time::http::percent_decode("bad%zz").has_value()) {
    return fail("test_percent_decode", "malformed escapes should be rejected");
  }
  return 0;
}

int test_concurrent_requests_get_consistent_snapshots() {
  const Fixture fixture;
  const bool has_tokyo = utc_time::clock::is_valid_timezone("Asia/Tokyo");

  constexpr int kRequests = 50;
  std::vector<std::string> bodies(kRequests);
  std::vector<std::string> targets(kRequests);
  std::vector<std::thread> workers;
  std::atomic<bool> go{false};

  for (int i = 0; i < kRequests; ++i) {
    targets[i] = (has_tokyo && i % 2 == 1) ? "/api/time/timezone/Asia/Tokyo" : "/api/time";
    workers.emplace_back([&, i]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      bodies[i] = fixture.router.handle(make_request(beast_http::verb::get, targets[i])).body();
    });
  }
  go = true;
  for (auto& worker : workers) {
    worker.join();
  }

  for (int i = 0; i < kRequests; ++i) {
    const auto doc = nlohmann::json::parse(bodies[i]);
    const auto seconds = doc["seconds"].get<std::int64_t>();
    const auto nanos = doc["nanosecond"].get<std::int64_t>();
    if (doc["unix"]["seconds"] != seconds || doc["nanos_since_epoch"] != seconds * 1000000000LL + nanos ||
        doc["milliseconds"] != seconds * 1000LL + nanos / 1000000LL) {
      return fail("test_concurrent_requests_get_consistent_snapshots", "fields from different snapshots");
    }

    const bool tokyo = targets[i] != "/api/time";
    const std::string expected_zone = tokyo ? "Asia/Tokyo" : "UTC";
    const int expected_offset = tokyo ? 9 * 3600 : 0;
    if (doc["timezone"] != expected_zone || doc["offset"] != expected_offset) {
      return fail("test_concurrent_requests_get_consistent_snapshots", "zone leaked between requests");
    }
  }
  return 0;
}

class SlowPeerQuery final : public utc_time::sync::PeerQuery {
 public:
  utc_time::sync::PeerList query_peers(std::chrono::milliseconds /*timeout*/) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    return {};
  }
};

Response fetch(const std::uint16_t port, const std::string& target) {
  namespace net = boost::asio;
  net::io_context io;
  net::ip::tcp::resolver resolver(io);
  boost::beast::tcp_stream stream(io);
  stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

  auto request = make_request(beast_http::verb::get, target);
  beast_http::write(stream, request);

  boost::beast::flat_buffer buffer;
  Response response;
  beast_http::read(stream, buffer, response);

  boost::beast::error_code ec;
  stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
  return response;
}

int test_server_serves_and_enforces_deadline() {
  utc_time::sync::SyncMonitorOptions monitor_options{};
  monitor_options.shm_units = {};
  const utc_time::sync::SyncMonitor monitor(monitor_options, std::make_shared<SlowPeerQuery>());

  const ToolContext context{.sync = &monitor, .ntp = {}, .status_timeout = std::chrono::milliseconds(2000)};
  const Dispatcher dispatcher(utc_time::mcp::build_registry(context), context);
  const HealthExporter exporter(&monitor, std::chrono::milliseconds(2000));
  const Router router(dispatcher, exporter, ApiKeyValidator{});

  HttpServer server(HttpServerOptions{.bind_address = "127.0.0.1",
                                      .port = 0,
                                      .handler_threads = 2,
                                      .request_timeout = std::chrono::milliseconds(150)},
                    router);
  try {
    server.start();
  } catch (const std::exception& ex) {
    return fail("test_server_serves_and_enforces_deadline", ex.what());
  }

  Response fast;
  Response slow;
  try {
    fast = fetch(server.port(), "/api/unix");
    slow = fetch(server.port(), "/health");
  } catch (const std::exception& ex) {
    server.stop();
    return fail("test_server_serves_and_enforces_deadline", ex.what());
  }
  server.stop();

  if (fast.result() != beast_http::status::ok || !body_json(fast).contains("seconds")) {
    return fail("test_server_serves_and_enforces_deadline", "fast route should answer 200");
  }
  if (slow.result() != beast_http::status::service_unavailable || body_json(slow)["error"] != "request timed out") {
    return fail("test_server_serves_and_enforces_deadline", "slow route should answer 503 at the deadline");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_health_and_metrics_routes(); rc != 0) return rc;
  if (int rc = test_health_document_states(); rc != 0) return rc;
  if (int rc = test_api_routes(); rc != 0) return rc;
  if (int rc = test_jsonrpc_over_http(); rc != 0) return rc;
  if (int rc = test_api_key_enforcement(); rc != 0) return rc;
  if (int rc = test_api_keys_from_environment(); rc != 0) return rc;
  if (int rc = test_percent_decode(); rc != 0) return rc;
  if (int rc = test_concurrent_requests_get_consistent_snapshots(); rc != 0) return rc;
  if (int rc = test_server_serves_and_enforces_deadline(); rc != 0) return rc;

  std::cout << "[PASS] http unit tests\n";
  return 0;
}
