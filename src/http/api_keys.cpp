#include "http/api_keys.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/log.hpp"

namespace utc_time::http {
namespace {

constexpr const char* kTag = "http";
constexpr std::string_view kKeyPrefix = "API_KEY_";
constexpr std::string_view kKeyList = "API_KEYS";

std::string_view trim(std::string_view value) noexcept {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool iequals_prefix(const std::string_view text, const std::string_view prefix) noexcept {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

ApiKeyValidator ApiKeyValidator::from_environment(char** envp) {
  ApiKeyValidator validator;
  if (envp == nullptr) {
    return validator;
  }

  for (char** entry = envp; *entry != nullptr; ++entry) {
    const std::string_view variable(*entry);
    const auto eq = variable.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const auto name = variable.substr(0, eq);
    const auto value = trim(variable.substr(eq + 1));
    if (value.empty()) {
      continue;
    }

    if (name == kKeyList) {
      std::size_t index = 0;
      std::size_t start = 0;
      while (start <= value.size()) {
        const auto comma = value.find(',', start);
        const auto token = trim(value.substr(start, comma == std::string_view::npos ? value.npos : comma - start));
        if (!token.empty()) {
          validator.add(std::string(token), "key_" + std::to_string(++index));
        }
        if (comma == std::string_view::npos) {
          break;
        }
        start = comma + 1;
      }
      continue;
    }

    if (name.size() <= kKeyPrefix.size() || name.substr(0, kKeyPrefix.size()) != kKeyPrefix) {
      continue;
    }
    const auto suffix = to_lower(name.substr(kKeyPrefix.size()));

    if (value.front() != '{') {
      validator.add(std::string(value), suffix);
      continue;
    }

    const auto parsed = nlohmann::json::parse(value.begin(), value.end(), nullptr, false);
    const auto key_it = parsed.is_object() ? parsed.find("key") : parsed.end();
    if (parsed.is_discarded() || !parsed.is_object() || key_it == parsed.end() || !key_it->is_string()) {
      core::log_warn(kTag, "ignoring malformed " + std::string(name));
      continue;
    }
    const auto name_it = parsed.find("name");
    validator.add(key_it->get<std::string>(),
                  name_it != parsed.end() && name_it->is_string() ? name_it->get<std::string>() : suffix);
  }
  return validator;
}

ApiKeyValidator ApiKeyValidator::from_keys(const std::vector<ApiKey>& keys) {
  ApiKeyValidator validator;
  for (const auto& key : keys) {
    validator.add(key.key, key.name);
  }
  return validator;
}

void ApiKeyValidator::add(std::string key, std::string name) {
  if (key.empty()) {
    return;
  }
  keys_.insert_or_assign(std::move(key), std::move(name));
}

std::optional<std::string> ApiKeyValidator::validate(const std::string_view key) const {
  if (key.empty()) {
    return std::nullopt;
  }
  const auto it = keys_.find(std::string(key));
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> extract_api_key(const std::string_view authorization, const std::string_view x_api_key) {
  constexpr std::string_view kBearer = "Bearer ";
  if (iequals_prefix(authorization, kBearer)) {
    const auto token = trim(authorization.substr(kBearer.size()));
    if (!token.empty()) {
      return std::string(token);
    }
  }
  const auto header = trim(x_api_key);
  if (!header.empty()) {
    return std::string(header);
  }
  return std::nullopt;
}

}  // namespace utc_time::http
