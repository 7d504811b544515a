#include "mcp/tools.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "clock/time_service.hpp"
#include "sync/sync_monitor.hpp"

namespace utc_time::mcp {

namespace {

std::string require_string(const nlohmann::json& params, const char* key) {
  if (!params.is_object()) {
    throw std::invalid_argument(std::string(key) + " required");
  }
  const auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(key) + " required");
  }
  return it->get<std::string>();
}

std::int64_t require_timestamp(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("timestamp required");
  }
  const auto it = params.find("timestamp");
  if (it == params.end() || !it->is_number()) {
    throw std::invalid_argument("timestamp required");
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw std::invalid_argument("Invalid timestamp");
    }
    return static_cast<std::int64_t>(value);
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }

  const double value = it->get<double>();
  if (!std::isfinite(value) || std::trunc(value) != value || std::fabs(value) > 9.0e15) {
    throw std::invalid_argument("Invalid timestamp");
  }
  return static_cast<std::int64_t>(value);
}

nlohmann::json string_property(const char* description) {
  return nlohmann::json{{"type", "string"}, {"description", description}};
}

nlohmann::json empty_schema() {
  return nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
}

nlohmann::json reference_summary(const core::NtpReferenceConfig& ntp) {
  return nlohmann::json{
      {"servers", ntp.servers},
      {"pps", {{"mode", std::string(core::hardware_toggle_name(ntp.pps))}, {"device", ntp.pps_device}}},
      {"gps", {{"mode", std::string(core::hardware_toggle_name(ntp.gps))}, {"device", ntp.gps_device}}},
      {"local_stratum", ntp.local_stratum}};
}

}  // namespace

const Tool* Registry::find_tool(const std::string& name) const {
  const auto it = tool_index_.find(name);
  return it == tool_index_.end() ? nullptr : &tools_[it->second];
}

const Prompt* Registry::find_prompt(const std::string& name) const {
  const auto it = prompt_index_.find(name);
  return it == prompt_index_.end() ? nullptr : &prompts_[it->second];
}

RegistryBuilder::RegistryBuilder() : registry_(std::make_unique<Registry>(Registry::Passkey{})) {}

RegistryBuilder& RegistryBuilder::add_tool(Tool tool) {
  if (!registry_) {
    throw std::logic_error("registry already frozen");
  }
  if (tool.name.empty() || !tool.handler) {
    throw std::invalid_argument("tool needs a name and a handler");
  }
  if (registry_->tool_index_.count(tool.name) != 0) {
    throw std::invalid_argument("duplicate tool: " + tool.name);
  }
  registry_->tool_index_.emplace(tool.name, registry_->tools_.size());
  registry_->tools_.push_back(std::move(tool));
  return *this;
}

RegistryBuilder& RegistryBuilder::add_prompt(Prompt prompt) {
  if (!registry_) {
    throw std::logic_error("registry already frozen");
  }
  if (prompt.name.empty()) {
    throw std::invalid_argument("prompt needs a name");
  }
  if (registry_->prompt_index_.count(prompt.name) != 0) {
    throw std::invalid_argument("duplicate prompt: " + prompt.name);
  }
  registry_->prompt_index_.emplace(prompt.name, registry_->prompts_.size());
  registry_->prompts_.push_back(std::move(prompt));
  return *this;
}

std::shared_ptr<const Registry> RegistryBuilder::freeze() {
  if (!registry_) {
    throw std::logic_error("registry already frozen");
  }
  return std::shared_ptr<const Registry>(registry_.release());
}

nlohmann::json time_payload(const nlohmann::json& /*params*/) {
  return clock::describe_time(clock::snapshot_time());
}

nlohmann::json unix_payload(const nlohmann::json& /*params*/) { return clock::describe_unix(clock::snapshot_time()); }

nlohmann::json nanos_payload(const nlohmann::json& /*params*/) {
  const auto snapshot = clock::snapshot_time();
  return nlohmann::json{{"nanoseconds", snapshot.nanos_since_epoch()},
                        {"seconds", snapshot.seconds},
                        {"subsec_nanos", snapshot.nanos}};
}

nlohmann::json formatted_time_payload(const nlohmann::json& params) {
  const auto format = require_string(params, "format");
  const auto snapshot = clock::snapshot_time();
  return nlohmann::json{{"formatted", clock::format_time(snapshot, format)},
                        {"format", format},
                        {"unix_seconds", snapshot.seconds},
                        {"unix_nanos", snapshot.nanos}};
}

nlohmann::json timezone_time_payload(const nlohmann::json& params) {
  const auto timezone = require_string(params, "timezone");
  return clock::describe_time(clock::snapshot_time(), timezone);
}

nlohmann::json timezones_payload(const nlohmann::json& /*params*/) {
  const auto zones = clock::list_timezones();
  return nlohmann::json{{"timezones", zones}, {"count", zones.size()}};
}

nlohmann::json convert_time_payload(const nlohmann::json& params) {
  const auto timestamp = require_timestamp(params);
  const auto to_timezone = require_string(params, "to_timezone");

  std::string from_timezone = "UTC";
  if (const auto it = params.find("from_timezone"); it != params.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw std::invalid_argument("from_timezone must be a string");
    }
    from_timezone = it->get<std::string>();
  }

  return clock::convert_time(timestamp, from_timezone, to_timezone);
}

nlohmann::json ntp_status_payload(const ToolContext& context) {
  const auto status = context.sync != nullptr ? context.sync->query_status(context.status_timeout)
                                              : sync::unavailable_status("synchronization monitor disabled");

  auto payload = sync::to_json(status);
  payload["health"] = std::string(sync::sync_health(status));
  payload["references"] = reference_summary(context.ntp);
  if (!status.available) {
    payload["message"] = "NTP not available or not synchronized";
  }
  return payload;
}

nlohmann::json ntp_peers_payload(const ToolContext& context) {
  if (context.sync == nullptr) {
    return nlohmann::json{{"available", false}, {"error", "synchronization monitor disabled"}};
  }

  const auto report = context.sync->query_peers(context.status_timeout);
  if (!report.available) {
    return nlohmann::json{{"available", false}, {"error", report.error}};
  }

  nlohmann::json peers = nlohmann::json::array();
  for (const auto& peer : report.peers) {
    peers.push_back(sync::to_json(peer));
  }
  return nlohmann::json{{"available", true}, {"count", report.peers.size()}, {"peers", peers}};
}

std::string substitute_template(const std::string& text, const std::unordered_map<std::string, std::string>& values) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find('{', pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    const auto close = text.find('}', open + 1);
    if (close == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }

    out.append(text, pos, open - pos);
    const auto it = values.find(text.substr(open + 1, close - open - 1));
    if (it != values.end()) {
      out.append(it->second);
    } else {
      out.append(text, open, close - open + 1);
    }
    pos = close + 1;
  }
  return out;
}

std::shared_ptr<const Registry> build_registry(const ToolContext& context) {
  RegistryBuilder builder;

  builder
      .add_tool(Tool{.name = "get_time",
                     .title = "Get Current Time",
                     .description = "Get current UTC time with full Unix/POSIX details",
                     .input_schema = empty_schema(),
                     .handler = time_payload})
      .add_tool(Tool{.name = "get_unix_time",
                     .title = "Get Unix Time",
                     .description = "Get Unix epoch time with nanosecond precision",
                     .input_schema = empty_schema(),
                     .handler = unix_payload})
      .add_tool(Tool{.name = "get_nanos",
                     .title = "Get Nanoseconds",
                     .description = "Get nanoseconds since Unix epoch",
                     .input_schema = empty_schema(),
                     .handler = nanos_payload})
      .add_tool(Tool{.name = "get_time_formatted",
                     .title = "Get Formatted Time",
                     .description = "Get time formatted with strftime format string (e.g., '%Y-%m-%d %H:%M:%S')",
                     .input_schema = nlohmann::json{{"type", "object"},
                                                    {"properties",
                                                     {{"format", string_property("strftime format string")}}},
                                                    {"required", {"format"}}},
                     .handler = formatted_time_payload})
      .add_tool(Tool{.name = "get_time_with_timezone",
                     .title = "Get Time in Timezone",
                     .description = "Get time in specified timezone (IANA name like 'America/New_York')",
                     .input_schema = nlohmann::json{{"type", "object"},
                                                    {"properties",
                                                     {{"timezone", string_property("IANA timezone name")}}},
                                                    {"required", {"timezone"}}},
                     .handler = timezone_time_payload})
      .add_tool(Tool{.name = "list_timezones",
                     .title = "List Timezones",
                     .description = "List all available IANA timezones",
                     .input_schema = empty_schema(),
                     .handler = timezones_payload})
      .add_tool(Tool{.name = "convert_time",
                     .title = "Convert Time",
                     .description = "Convert Unix timestamp between timezones",
                     .input_schema =
                         nlohmann::json{{"type", "object"},
                                        {"properties",
                                         {{"timestamp", {{"type", "number"}, {"description", "Unix timestamp in seconds"}}},
                                          {"from_timezone", string_property("Source timezone, defaults to UTC")},
                                          {"to_timezone", string_property("Target timezone")}}},
                                        {"required", {"timestamp", "to_timezone"}}},
                     .handler = convert_time_payload})
      .add_tool(Tool{.name = "get_ntp_status",
                     .title = "NTP Status",
                     .description = "Get NTP synchronization status and performance metrics (read-only)",
                     .input_schema = empty_schema(),
                     .handler = [context](const nlohmann::json&) { return ntp_status_payload(context); }})
      .add_tool(Tool{.name = "get_ntp_peers",
                     .title = "NTP Peers",
                     .description = "Get information about NTP peers and their status (read-only)",
                     .input_schema = empty_schema(),
                     .handler = [context](const nlohmann::json&) { return ntp_peers_payload(context); }});

  builder
      .add_prompt(Prompt{.name = "time",
                         .title = "Current Time",
                         .description = "Get the current UTC time with detailed information",
                         .arguments = {},
                         .description_template = "Current UTC time with full details",
                         .message_template = "Here is the current UTC time:\n\n{data}",
                         .data = time_payload})
      .add_prompt(Prompt{.name = "unix_time",
                         .title = "Unix Timestamp",
                         .description = "Get the current Unix timestamp with nanosecond precision",
                         .arguments = {},
                         .description_template = "Current Unix timestamp",
                         .message_template = "Here is the current Unix timestamp:\n\n{data}",
                         .data = unix_payload})
      .add_prompt(Prompt{.name = "time_in",
                         .title = "Time in Timezone",
                         .description = "Get the current time in a specific timezone",
                         .arguments = {PromptArgument{.name = "timezone",
                                                      .description = "IANA timezone name (e.g., 'America/New_York')",
                                                      .required = true}},
                         .description_template = "Current time in {timezone}",
                         .message_template = "Here is the current time in {timezone}:\n\n{data}",
                         .data = timezone_time_payload})
      .add_prompt(Prompt{.name = "format_time",
                         .title = "Format Time",
                         .description = "Get the current time in a custom format",
                         .arguments = {PromptArgument{.name = "format",
                                                      .description = "strftime format string (e.g., '%Y-%m-%d')",
                                                      .required = true}},
                         .description_template = "Time formatted as '{format}'",
                         .message_template = "Here is the current time formatted as '{format}':\n\n{data}",
                         .data = formatted_time_payload});

  return builder.freeze();
}

}  // namespace utc_time::mcp
