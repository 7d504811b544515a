#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"

namespace utc_time::sync {
class SyncMonitor;
}

namespace utc_time::mcp {

// Handlers throw to report failure. tools/call turns any exception into a
// flagged result; legacy methods map std::invalid_argument to invalid params.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json&)>;

struct Tool {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
  ToolHandler handler;
};

struct PromptArgument {
  std::string name;
  std::string description;
  bool required{false};
};

// Computes the {data} block a prompt template embeds.
using PromptData = std::function<nlohmann::json(const nlohmann::json&)>;

struct Prompt {
  std::string name;
  std::string title;
  std::string description;
  std::vector<PromptArgument> arguments;
  // Text with {argument} and {data} placeholders.
  std::string description_template;
  std::string message_template;
  PromptData data;
};

// Frozen tool/prompt table. Only RegistryBuilder can create one, and it
// exposes const lookups only, so concurrent readers need no locking.
class Registry {
  friend class RegistryBuilder;

  struct Passkey {
    explicit Passkey() = default;
  };

 public:
  explicit Registry(Passkey /*key*/) {}

  [[nodiscard]] const Tool* find_tool(const std::string& name) const;
  [[nodiscard]] const Prompt* find_prompt(const std::string& name) const;

  [[nodiscard]] const std::vector<Tool>& tools() const noexcept { return tools_; }
  [[nodiscard]] const std::vector<Prompt>& prompts() const noexcept { return prompts_; }

 private:
  std::vector<Tool> tools_;
  std::vector<Prompt> prompts_;
  std::unordered_map<std::string, std::size_t> tool_index_;
  std::unordered_map<std::string, std::size_t> prompt_index_;
};

class RegistryBuilder {
 public:
  RegistryBuilder();

  // Throws std::invalid_argument on an empty or duplicate name.
  RegistryBuilder& add_tool(Tool tool);
  RegistryBuilder& add_prompt(Prompt prompt);

  // The builder is spent afterwards.
  std::shared_ptr<const Registry> freeze();

 private:
  std::unique_ptr<Registry> registry_;
};

struct ToolContext {
  const sync::SyncMonitor* sync{nullptr};
  core::NtpReferenceConfig ntp{};
  std::chrono::milliseconds status_timeout{2000};
};

// Payload builders shared by tools, prompts, legacy methods and HTTP routes.
nlohmann::json time_payload(const nlohmann::json& params);
nlohmann::json unix_payload(const nlohmann::json& params);
nlohmann::json nanos_payload(const nlohmann::json& params);
nlohmann::json formatted_time_payload(const nlohmann::json& params);
nlohmann::json timezone_time_payload(const nlohmann::json& params);
nlohmann::json timezones_payload(const nlohmann::json& params);
nlohmann::json convert_time_payload(const nlohmann::json& params);
nlohmann::json ntp_status_payload(const ToolContext& context);
nlohmann::json ntp_peers_payload(const ToolContext& context);

std::shared_ptr<const Registry> build_registry(const ToolContext& context);

// Replaces each {name} with the matching entry of `values`; unknown
// placeholders are left untouched.
std::string substitute_template(const std::string& text, const std::unordered_map<std::string, std::string>& values);

}  // namespace utc_time::mcp
