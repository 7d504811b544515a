#pragma once

namespace utc_time::core {

constexpr const char* kServiceName = "mcp-utc-time-server";
constexpr const char* kServiceVersion = "0.1.0";

}  // namespace utc_time::core
