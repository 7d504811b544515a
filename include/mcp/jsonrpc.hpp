#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace utc_time::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
  std::optional<nlohmann::json> data{};
};

// Protocol-level failure raised while handling a request.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message, std::optional<nlohmann::json> data = std::nullopt);

  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] const std::optional<nlohmann::json>& data() const noexcept { return data_; }
  [[nodiscard]] JsonRpcError to_error() const;

 private:
  int code_;
  std::optional<nlohmann::json> data_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  // Absent and null ids both mark a notification.
  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value() || id->is_null(); }
};

// Throws std::invalid_argument when the envelope is not a JSON-RPC 2.0 request.
JsonRpcRequest parse_request(const nlohmann::json& request);

// Best-effort id recovery from a parsed value. Returns null when nothing
// usable is found.
nlohmann::json recover_id(const nlohmann::json& request);

// Same for text that failed to parse. Only a top-level "id" key counts, the
// scan is linear in the input, and ids longer than 256 characters are dropped.
nlohmann::json recover_id_from_text(std::string_view raw);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace utc_time::mcp
