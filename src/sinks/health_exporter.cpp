#include "sinks/health_exporter.hpp"

#include <cmath>
#include <cstdio>
#include <string_view>

#include "core/version.hpp"
#include "sync/sync_monitor.hpp"

namespace utc_time::sinks {
namespace {

void add_metric(std::string& out, const char* name, const char* help, const char* type, const std::string& sample) {
  out += "# HELP ";
  out += name;
  out += ' ';
  out += help;
  out += "\n# TYPE ";
  out += name;
  out += ' ';
  out += type;
  out += '\n';
  out += sample;
  out += '\n';
}

std::string format_double(const double value) {
  if (!std::isfinite(value)) {
    return "NaN";
  }
  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.6f", value);
  return buffer;
}

// Label values escape backslash, quote and newline.
std::string escape_label(const std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    if (c == '\\' || c == '"') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

nlohmann::json build_health_document(const clock::TimeSnapshot& snapshot, const sync::SyncStatus& status) {
  return nlohmann::json{
      {"status", status.available && status.synced ? "healthy" : "degraded"},
      {"version", core::kServiceVersion},
      {"service", core::kServiceName},
      {"timestamp", clock::format_time(snapshot, "%Y-%m-%dT%H:%M:%SZ")},
      {"sync",
       {{"available", status.available},
        {"synced", status.synced},
        {"offset_ms", status.offset_ms},
        {"stratum", status.stratum},
        {"source", std::string(sync::sync_source_name(status.source))}}}};
}

std::string render_metrics(const clock::TimeSnapshot& snapshot, const sync::SyncStatus& status) {
  std::string out;
  out.reserve(1024);

  add_metric(out, "mcp_time_seconds", "Current Unix time in seconds", "gauge",
             "mcp_time_seconds " + std::to_string(snapshot.seconds));
  add_metric(out, "mcp_time_nanos", "Nanosecond part of the current second", "gauge",
             "mcp_time_nanos " + std::to_string(snapshot.nanos));
  add_metric(out, "mcp_ntp_available", "Whether a clock synchronization source answered", "gauge",
             std::string("mcp_ntp_available ") + (status.available ? "1" : "0"));
  add_metric(out, "mcp_ntp_synced", "Whether the clock is synchronized", "gauge",
             std::string("mcp_ntp_synced ") + (status.synced ? "1" : "0"));
  add_metric(out, "mcp_ntp_offset_ms", "Clock offset from the reference in milliseconds", "gauge",
             "mcp_ntp_offset_ms " + format_double(status.offset_ms));
  add_metric(out, "mcp_ntp_stratum", "Synchronization stratum", "gauge",
             "mcp_ntp_stratum " + std::to_string(status.stratum));
  add_metric(out, "mcp_ntp_source", "Source of the synchronization status", "gauge",
             "mcp_ntp_source{source=\"" + escape_label(sync::sync_source_name(status.source)) + "\"} 1");
  add_metric(out, "mcp_build_info", "Build information", "gauge",
             std::string("mcp_build_info{version=\"") + escape_label(core::kServiceVersion) + "\"} 1");
  return out;
}

HealthExporter::HealthExporter(const sync::SyncMonitor* monitor, const std::chrono::milliseconds status_timeout)
    : monitor_(monitor), status_timeout_(status_timeout) {}

sync::SyncStatus HealthExporter::current_status() const {
  if (monitor_ == nullptr) {
    return sync::unavailable_status("synchronization monitor disabled");
  }
  return monitor_->query_status(status_timeout_);
}

nlohmann::json HealthExporter::health() const {
  const auto status = current_status();
  return build_health_document(clock::snapshot_time(), status);
}

std::string HealthExporter::metrics() const {
  const auto status = current_status();
  return render_metrics(clock::snapshot_time(), status);
}

}  // namespace utc_time::sinks
