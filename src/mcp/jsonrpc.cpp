#include "mcp/jsonrpc.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace utc_time::mcp {

namespace {

// Longer ids are not echoed back from text that failed to parse.
constexpr std::size_t kMaxRecoveredIdLength = 256;

bool is_valid_id(const nlohmann::json& id) { return id.is_null() || id.is_string() || id.is_number(); }

void validate_id(const nlohmann::json& id) {
  if (is_valid_id(id)) {
    return;
  }
  throw std::invalid_argument("JSON-RPC id must be string, number, or null");
}

// One past the closing quote of the string opened at `open`; npos when the
// string is unterminated.
std::size_t skip_string(const std::string_view text, const std::size_t open) {
  for (std::size_t i = open + 1; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
    } else if (text[i] == '"') {
      return i + 1;
    }
  }
  return std::string_view::npos;
}

std::size_t skip_space(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// The string or number token starting at `start`, or empty when it is
// neither or longer than kMaxRecoveredIdLength.
std::string_view id_token(const std::string_view text, const std::size_t start) {
  if (start >= text.size()) {
    return {};
  }

  std::size_t end = start;
  if (text[start] == '"') {
    end = skip_string(text.substr(0, std::min(text.size(), start + kMaxRecoveredIdLength + 1)), start);
    if (end == std::string_view::npos) {
      return {};
    }
  } else {
    constexpr std::string_view kNumberChars = "+-.0123456789eE";
    while (end < text.size() && end - start <= kMaxRecoveredIdLength &&
           kNumberChars.find(text[end]) != std::string_view::npos) {
      ++end;
    }
    if (end - start > kMaxRecoveredIdLength) {
      return {};
    }
  }
  return text.substr(start, end - start);
}

}  // namespace

RpcError::RpcError(const int code, const std::string& message, std::optional<nlohmann::json> data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {}

JsonRpcError RpcError::to_error() const { return JsonRpcError{.code = code_, .message = what(), .data = data_}; }

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw std::invalid_argument("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw std::invalid_argument("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    validate_id(*id_it);
    parsed.id = *id_it;
  }

  return parsed;
}

nlohmann::json recover_id(const nlohmann::json& request) {
  if (!request.is_object()) {
    return nullptr;
  }
  const auto id_it = request.find("id");
  if (id_it == request.end() || !is_valid_id(*id_it)) {
    return nullptr;
  }
  return *id_it;
}

nlohmann::json recover_id_from_text(const std::string_view raw) {
  int depth = 0;
  std::size_t pos = 0;
  while (pos < raw.size()) {
    const char c = raw[pos];
    if (c == '"') {
      const auto end = skip_string(raw, pos);
      if (end == std::string_view::npos) {
        return nullptr;
      }
      if (depth == 1 && raw.substr(pos, end - pos) == "\"id\"") {
        const auto colon = skip_space(raw, end);
        if (colon < raw.size() && raw[colon] == ':') {
          const auto token = id_token(raw, skip_space(raw, colon + 1));
          if (token.empty()) {
            return nullptr;
          }
          auto parsed = nlohmann::json::parse(token.begin(), token.end(), nullptr, false);
          if (parsed.is_discarded() || !is_valid_id(parsed)) {
            return nullptr;
          }
          return parsed;
        }
      }
      pos = end;
      continue;
    }

    if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      --depth;
    }
    ++pos;
  }
  return nullptr;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json body{{"code", error.code}, {"message", error.message}};
  if (error.data.has_value()) {
    body["data"] = *error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", body}};
}

}  // namespace utc_time::mcp
