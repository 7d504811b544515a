#include "mcp/dispatcher.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/log.hpp"
#include "core/version.hpp"

namespace utc_time::mcp {

namespace {

constexpr const char* kTag = "server";

constexpr const char* kInstructions =
    "High-precision UTC time server. Use get_time for a full time document, get_time_formatted for strftime "
    "output, get_time_with_timezone or convert_time for other zones, and get_ntp_status or get_ntp_peers for "
    "clock synchronization state.";

bool starts_with(const std::string_view text, const std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

const nlohmann::json& object_params(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw RpcError(kInvalidParams, "params must be an object");
  }
  return params;
}

std::string argument_text(const nlohmann::json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

nlohmann::json text_content(const std::string& text) {
  return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

}  // namespace

MethodFamily classify_method(const std::string_view method) noexcept {
  if (method == "initialize" || method == "ping") {
    return MethodFamily::kLifecycle;
  }
  if (method == "tools/list" || method == "tools/call") {
    return MethodFamily::kTools;
  }
  if (method == "prompts/list" || method == "prompts/get") {
    return MethodFamily::kPrompts;
  }
  if (starts_with(method, "time/")) {
    return MethodFamily::kLegacy;
  }
  if (starts_with(method, "notifications/")) {
    return MethodFamily::kNotification;
  }
  return MethodFamily::kUnknown;
}

Dispatcher::Dispatcher(std::shared_ptr<const Registry> registry, ToolContext context)
    : registry_(std::move(registry)), context_(std::move(context)) {
  if (!registry_) {
    throw std::invalid_argument("dispatcher requires a registry");
  }
}

std::optional<std::string> Dispatcher::handle_message(const std::string_view raw) const {
  const auto request = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (request.is_discarded()) {
    return make_error_response(recover_id_from_text(raw), JsonRpcError{.code = kParseError, .message = "Parse error"})
        .dump();
  }

  const auto response = handle_request(request);
  if (!response.has_value()) {
    return std::nullopt;
  }
  return response->dump();
}

std::optional<nlohmann::json> Dispatcher::handle_request(const nlohmann::json& request) const {
  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const std::invalid_argument& ex) {
    return make_error_response(recover_id(request),
                               JsonRpcError{.code = kInvalidRequest, .message = std::string("Invalid Request: ") + ex.what()});
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  std::optional<nlohmann::json> response;
  try {
    response = make_result_response(id, route(parsed));
  } catch (const RpcError& ex) {
    response = make_error_response(id, ex.to_error());
  } catch (const std::invalid_argument& ex) {
    response = make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::exception& ex) {
    core::log_error(kTag, "method " + parsed.method + " failed: " + ex.what());
    response = make_error_response(id, JsonRpcError{.code = kInternalError, .message = "Internal error"});
  }

  if (parsed.is_notification()) {
    return std::nullopt;
  }
  return response;
}

nlohmann::json Dispatcher::route(const JsonRpcRequest& request) const {
  switch (classify_method(request.method)) {
    case MethodFamily::kLifecycle:
      return handle_lifecycle(request);
    case MethodFamily::kTools:
      return handle_tools(request);
    case MethodFamily::kPrompts:
      return handle_prompts(request);
    case MethodFamily::kLegacy:
      return handle_legacy(request);
    case MethodFamily::kNotification:
      return nlohmann::json::object();
    case MethodFamily::kUnknown:
      throw RpcError(kMethodNotFound, "Method not found: " + request.method);
  }
  throw RpcError(kInternalError, "unclassified method");
}

nlohmann::json Dispatcher::handle_lifecycle(const JsonRpcRequest& request) const {
  if (request.method == "ping") {
    return nlohmann::json::object();
  }

  object_params(request.params);
  if (const auto it = request.params.find("protocolVersion"); it != request.params.end() && it->is_string() &&
                                                              *it != kProtocolVersion) {
    core::log_info(kTag, "client requested protocol " + it->get<std::string>() + "; answering with " +
                             kProtocolVersion);
  }

  return nlohmann::json{
      {"protocolVersion", kProtocolVersion},
      {"serverInfo", {{"name", core::kServiceName}, {"version", core::kServiceVersion}}},
      {"capabilities", {{"tools", {{"listChanged", false}}}, {"prompts", {{"listChanged", false}}}}},
      {"instructions", kInstructions}};
}

nlohmann::json Dispatcher::handle_tools(const JsonRpcRequest& request) const {
  if (request.method == "tools/list") {
    return handle_tools_list();
  }
  return handle_tools_call(request.params);
}

nlohmann::json Dispatcher::handle_prompts(const JsonRpcRequest& request) const {
  if (request.method == "prompts/list") {
    return handle_prompts_list();
  }
  return handle_prompts_get(request.params);
}

nlohmann::json Dispatcher::handle_legacy(const JsonRpcRequest& request) const {
  const auto& method = request.method;
  const auto& params = request.params;

  if (method == "time/get") {
    return time_payload(params);
  }
  if (method == "time/get_with_format") {
    return formatted_time_payload(params);
  }
  if (method == "time/get_with_timezone") {
    return timezone_time_payload(params);
  }
  if (method == "time/get_unix") {
    return unix_payload(params);
  }
  if (method == "time/get_nanos") {
    return nanos_payload(params);
  }
  if (method == "time/list_timezones") {
    return timezones_payload(params);
  }
  if (method == "time/convert") {
    return convert_time_payload(params);
  }
  if (method == "time/ntp_status") {
    return ntp_status_payload(context_);
  }

  throw RpcError(kMethodNotFound, "Method not found: " + method);
}

nlohmann::json Dispatcher::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : registry_->tools()) {
    tools.push_back({{"name", tool.name},
                     {"title", tool.title},
                     {"description", tool.description},
                     {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Dispatcher::handle_tools_call(const nlohmann::json& params) const {
  object_params(params);

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw RpcError(kInvalidParams, "name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw RpcError(kInvalidParams, "arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto& name = name_it->get_ref<const std::string&>();
  const Tool* tool = registry_->find_tool(name);
  if (tool == nullptr) {
    return nlohmann::json{{"content", text_content("Unknown tool: " + name)}, {"isError", true}};
  }

  try {
    const auto payload = tool->handler(arguments);
    return nlohmann::json{{"content", text_content(payload.dump(2))}, {"isError", false}};
  } catch (const std::exception& ex) {
    core::log_debug(kTag, "tool " + name + " failed: " + ex.what());
    return nlohmann::json{{"content", text_content(std::string("Error: ") + ex.what())}, {"isError", true}};
  }
}

nlohmann::json Dispatcher::handle_prompts_list() const {
  nlohmann::json prompts = nlohmann::json::array();
  for (const auto& prompt : registry_->prompts()) {
    nlohmann::json arguments = nlohmann::json::array();
    for (const auto& argument : prompt.arguments) {
      arguments.push_back(
          {{"name", argument.name}, {"description", argument.description}, {"required", argument.required}});
    }
    prompts.push_back({{"name", prompt.name},
                       {"title", prompt.title},
                       {"description", prompt.description},
                       {"arguments", arguments}});
  }
  return nlohmann::json{{"prompts", prompts}};
}

nlohmann::json Dispatcher::handle_prompts_get(const nlohmann::json& params) const {
  object_params(params);

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw RpcError(kInvalidParams, "name must be a string");
  }

  const auto& name = name_it->get_ref<const std::string&>();
  const Prompt* prompt = registry_->find_prompt(name);
  if (prompt == nullptr) {
    throw RpcError(kInvalidParams, "Unknown prompt: " + name);
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw RpcError(kInvalidParams, "arguments must be an object");
    }
    arguments = *args_it;
  }

  std::unordered_map<std::string, std::string> values;
  for (const auto& argument : prompt->arguments) {
    const auto it = arguments.find(argument.name);
    if (it == arguments.end() || it->is_null()) {
      if (argument.required) {
        throw RpcError(kInvalidParams, "Missing required argument: " + argument.name);
      }
      continue;
    }
    values.emplace(argument.name, argument_text(*it));
  }

  try {
    values["data"] = prompt->data(arguments).dump(2);
  } catch (const std::invalid_argument& ex) {
    throw RpcError(kInvalidParams, ex.what());
  }

  return nlohmann::json{
      {"description", substitute_template(prompt->description_template, values)},
      {"messages",
       nlohmann::json::array(
           {{{"role", "user"},
             {"content", {{"type", "text"}, {"text", substitute_template(prompt->message_template, values)}}}}})}};
}

}  // namespace utc_time::mcp
