#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include "http/api_keys.hpp"
#include "mcp/dispatcher.hpp"
#include "sinks/health_exporter.hpp"

namespace utc_time::http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

struct RouterOptions {
  // Container deployments report it on /api/ntp/status.
  bool container_mode{false};
};

// Maps one parsed request to one response. Socket-free so it can run on any
// worker thread; all state it touches is read-only.
class Router {
 public:
  Router(const mcp::Dispatcher& dispatcher, const sinks::HealthExporter& exporter, ApiKeyValidator api_keys,
         RouterOptions options = {});

  [[nodiscard]] Response handle(const Request& request) const;

 private:
  Response route(const Request& request, std::string_view path) const;
  bool authorized(const Request& request) const;

  const mcp::Dispatcher& dispatcher_;
  const sinks::HealthExporter& exporter_;
  ApiKeyValidator api_keys_;
  RouterOptions options_;
};

Response make_json_response(beast_http::status status, const nlohmann::json& body, unsigned version,
                            bool keep_alive);
Response make_timeout_response(unsigned version);

// Decodes %XX escapes; returns nullopt on a malformed escape.
std::optional<std::string> percent_decode(std::string_view text);

}  // namespace utc_time::http
