#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace utc_time::http {

struct ApiKey {
  std::string key;
  std::string name;
};

class ApiKeyValidator {
 public:
  ApiKeyValidator() = default;

  // Collects API_KEY_<suffix> entries (plain key or {"key":..,"name":..})
  // and the comma-separated API_KEYS list from a null-terminated envp.
  static ApiKeyValidator from_environment(char** envp);
  static ApiKeyValidator from_keys(const std::vector<ApiKey>& keys);

  [[nodiscard]] bool has_keys() const noexcept { return !keys_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

  // Name of the matching key, or nullopt.
  [[nodiscard]] std::optional<std::string> validate(std::string_view key) const;

 private:
  void add(std::string key, std::string name);

  std::unordered_map<std::string, std::string> keys_;
};

// Credential from "Authorization: Bearer <key>" or, failing that, "X-API-Key".
std::optional<std::string> extract_api_key(std::string_view authorization, std::string_view x_api_key);

}  // namespace utc_time::http
