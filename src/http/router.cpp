#include "http/router.hpp"

#include <stdexcept>
#include <utility>

#include "clock/time_service.hpp"
#include "core/log.hpp"
#include "core/version.hpp"

namespace utc_time::http {
namespace {

constexpr const char* kTag = "http";
constexpr std::string_view kTimezoneRoute = "/api/time/timezone/";

void add_cors_headers(Response& response) {
  response.set(beast_http::field::access_control_allow_origin, "*");
  response.set(beast_http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  response.set(beast_http::field::access_control_allow_headers, "Content-Type, Authorization, X-API-Key");
}

Response make_text_response(const beast_http::status status, std::string body, const char* content_type,
                            const unsigned version, const bool keep_alive) {
  Response response{status, version};
  response.set(beast_http::field::server, std::string(core::kServiceName) + "/" + core::kServiceVersion);
  response.set(beast_http::field::content_type, content_type);
  add_cors_headers(response);
  response.keep_alive(keep_alive);
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

nlohmann::json available_endpoints() {
  return nlohmann::json::array({"GET /health", "GET /metrics", "GET /api/time", "GET /api/unix", "GET /api/nanos",
                                "GET /api/timezones", "GET /api/time/timezone/{timezone}", "GET /api/ntp/status",
                                "GET /api/ntp/peers", "POST /mcp"});
}

bool is_get_route(const std::string_view path) noexcept {
  return path == "/health" || path == "/metrics" || path == "/api/time" || path == "/api/unix" ||
         path == "/api/nanos" || path == "/api/timezones" || path == "/api/ntp/status" || path == "/api/ntp/peers" ||
         (path.size() > kTimezoneRoute.size() && path.substr(0, kTimezoneRoute.size()) == kTimezoneRoute);
}

int hex_value(const char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

Response make_json_response(const beast_http::status status, const nlohmann::json& body, const unsigned version,
                            const bool keep_alive) {
  return make_text_response(status, body.dump(), "application/json", version, keep_alive);
}

Response make_timeout_response(const unsigned version) {
  return make_json_response(beast_http::status::service_unavailable, nlohmann::json{{"error", "request timed out"}},
                            version, false);
}

std::optional<std::string> percent_decode(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out += text[i];
      continue;
    }
    if (i + 2 >= text.size()) {
      return std::nullopt;
    }
    const int high = hex_value(text[i + 1]);
    const int low = hex_value(text[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out += static_cast<char>((high << 4) | low);
    i += 2;
  }
  return out;
}

Router::Router(const mcp::Dispatcher& dispatcher, const sinks::HealthExporter& exporter, ApiKeyValidator api_keys,
               RouterOptions options)
    : dispatcher_(dispatcher), exporter_(exporter), api_keys_(std::move(api_keys)), options_(options) {}

Response Router::handle(const Request& request) const {
  const std::string_view target(request.target().data(), request.target().size());
  const auto path = target.substr(0, target.find('?'));

  try {
    return route(request, path);
  } catch (const std::exception& ex) {
    const auto method = request.method_string();
    core::log_error(kTag, std::string(method.data(), method.size()) + " " + std::string(path) + " failed: " + ex.what());
    return make_json_response(beast_http::status::internal_server_error, nlohmann::json{{"error", "internal error"}},
                              request.version(), request.keep_alive());
  }
}

bool Router::authorized(const Request& request) const {
  if (!api_keys_.has_keys()) {
    return true;
  }
  const auto authorization = request[beast_http::field::authorization];
  const auto x_api_key = request["X-API-Key"];
  const auto key = extract_api_key(std::string_view(authorization.data(), authorization.size()),
                                   std::string_view(x_api_key.data(), x_api_key.size()));
  return key.has_value() && api_keys_.validate(*key).has_value();
}

Response Router::route(const Request& request, const std::string_view path) const {
  const auto version = request.version();
  const bool keep_alive = request.keep_alive();
  const auto json_ok = [&](const nlohmann::json& body) {
    return make_json_response(beast_http::status::ok, body, version, keep_alive);
  };

  if (request.method() == beast_http::verb::options) {
    return make_text_response(beast_http::status::no_content, {}, "text/plain", version, keep_alive);
  }

  if (path == "/mcp") {
    if (request.method() != beast_http::verb::post) {
      return make_json_response(beast_http::status::method_not_allowed,
                                nlohmann::json{{"error", "method not allowed"}}, version, keep_alive);
    }
    if (!authorized(request)) {
      return make_json_response(beast_http::status::unauthorized, nlohmann::json{{"error", "unauthorized"}}, version,
                                keep_alive);
    }
    const auto response = dispatcher_.handle_message(request.body());
    if (!response.has_value()) {
      return make_text_response(beast_http::status::accepted, {}, "text/plain", version, keep_alive);
    }
    return make_text_response(beast_http::status::ok, *response, "application/json", version, keep_alive);
  }

  if (!is_get_route(path)) {
    return make_json_response(beast_http::status::not_found,
                              nlohmann::json{{"error", "Not found"}, {"available_endpoints", available_endpoints()}},
                              version, keep_alive);
  }
  if (request.method() != beast_http::verb::get) {
    return make_json_response(beast_http::status::method_not_allowed, nlohmann::json{{"error", "method not allowed"}},
                              version, keep_alive);
  }

  if (path == "/health") {
    return json_ok(exporter_.health());
  }
  if (path == "/metrics") {
    return make_text_response(beast_http::status::ok, exporter_.metrics(), "text/plain; version=0.0.4", version,
                              keep_alive);
  }

  if (!authorized(request)) {
    return make_json_response(beast_http::status::unauthorized, nlohmann::json{{"error", "unauthorized"}}, version,
                              keep_alive);
  }

  const nlohmann::json no_params = nlohmann::json::object();
  if (path == "/api/time") {
    return json_ok(mcp::time_payload(no_params));
  }
  if (path == "/api/unix") {
    return json_ok(mcp::unix_payload(no_params));
  }
  if (path == "/api/nanos") {
    return json_ok(mcp::nanos_payload(no_params));
  }
  if (path == "/api/timezones") {
    return json_ok(mcp::timezones_payload(no_params));
  }
  if (path == "/api/ntp/status") {
    auto payload = mcp::ntp_status_payload(dispatcher_.context());
    if (options_.container_mode) {
      payload["container_mode"] = true;
    }
    return json_ok(payload);
  }
  if (path == "/api/ntp/peers") {
    return json_ok(mcp::ntp_peers_payload(dispatcher_.context()));
  }

  const auto zone = percent_decode(path.substr(kTimezoneRoute.size()));
  if (!zone.has_value()) {
    return make_json_response(beast_http::status::bad_request, nlohmann::json{{"error", "malformed timezone"}},
                              version, keep_alive);
  }
  try {
    return json_ok(mcp::timezone_time_payload(nlohmann::json{{"timezone", *zone}}));
  } catch (const clock::TimezoneError& ex) {
    return make_json_response(beast_http::status::bad_request, nlohmann::json{{"error", ex.what()}}, version,
                              keep_alive);
  }
}

}  // namespace utc_time::http
