#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace utc_time::mcp {

constexpr const char* kProtocolVersion = "2025-06-18";

enum class MethodFamily { kLifecycle, kTools, kPrompts, kLegacy, kNotification, kUnknown };

[[nodiscard]] MethodFamily classify_method(std::string_view method) noexcept;

// Transport-independent JSON-RPC engine shared by STDIO and HTTP. Holds only
// read-only state, so one instance serves concurrent callers.
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<const Registry> registry, ToolContext context);

  // Raw line in, serialized response out. nullopt means nothing is sent
  // back (notifications).
  [[nodiscard]] std::optional<std::string> handle_message(std::string_view raw) const;
  [[nodiscard]] std::optional<nlohmann::json> handle_request(const nlohmann::json& request) const;

  [[nodiscard]] const Registry& registry() const noexcept { return *registry_; }
  [[nodiscard]] const ToolContext& context() const noexcept { return context_; }

 private:
  nlohmann::json route(const JsonRpcRequest& request) const;

  nlohmann::json handle_lifecycle(const JsonRpcRequest& request) const;
  nlohmann::json handle_tools(const JsonRpcRequest& request) const;
  nlohmann::json handle_prompts(const JsonRpcRequest& request) const;
  nlohmann::json handle_legacy(const JsonRpcRequest& request) const;

  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;
  nlohmann::json handle_prompts_list() const;
  nlohmann::json handle_prompts_get(const nlohmann::json& params) const;

  std::shared_ptr<const Registry> registry_;
  ToolContext context_;
};

}  // namespace utc_time::mcp
