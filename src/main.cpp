#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/log.hpp"
#include "core/version.hpp"
#include "http/api_keys.hpp"
#include "http/http_server.hpp"
#include "http/router.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "sinks/health_exporter.hpp"
#include "sync/peer_query.hpp"
#include "sync/sync_monitor.hpp"

extern char** environ;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string join_servers(const std::vector<std::string>& servers) {
  std::string out;
  for (const auto& server : servers) {
    if (!out.empty()) {
      out += ',';
    }
    out += server;
  }
  return out;
}

}  // namespace

std::string format_config_settings(const utc_time::core::ServerConfig& config, const std::string& config_path,
                                   const std::size_t api_key_count) {
  using utc_time::core::hardware_toggle_name;

  std::ostringstream output;
  output << "[server] " << utc_time::core::kServiceName << ' ' << utc_time::core::kServiceVersion
         << " | config=" << (config_path.empty() ? "<defaults>" : config_path)
         << " | mode=" << (config.http.only ? "http-only" : "stdio")
         << " | http_enabled=" << (config.http.enabled ? "true" : "false")
         << " | http_address=" << config.http.bind_address << ':' << config.http.port
         << " | http_threads=" << config.http.threads
         << " | http_request_timeout_ms=" << config.http.request_timeout.count()
         << " | api_keys=" << api_key_count
         << " | ntp_servers=" << join_servers(config.ntp.servers)
         << " | pps=" << hardware_toggle_name(config.ntp.pps)
         << " | gps=" << hardware_toggle_name(config.ntp.gps)
         << " | shm_unit=" << config.sync.shm_unit
         << " | status_timeout_ms=" << config.sync.status_timeout.count()
         << " | query_command=" << config.sync.query_command
         << " | log_level=" << utc_time::core::log_level_name(config.log_level);
  return output.str();
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  utc_time::core::ServerConfig config{};
  try {
    if (!config_path.empty()) {
      config = utc_time::core::load_server_config(config_path);
    }
    utc_time::core::apply_environment(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }
  utc_time::core::set_log_level(config.log_level);

  auto api_keys = utc_time::http::ApiKeyValidator::from_environment(environ);
  std::cerr << format_config_settings(config, config_path, api_keys.size()) << '\n';

  utc_time::sync::SyncMonitor monitor(
      utc_time::sync::SyncMonitorOptions{.shm_units = utc_time::core::shm_units(config),
                                         .shm_read_attempts = 4,
                                         .max_sample_age = config.sync.max_sample_age,
                                         .worker_threads = 2},
      std::make_shared<utc_time::sync::NtpqPeerQuery>(config.sync.query_command));

  const utc_time::mcp::ToolContext context{
      .sync = &monitor, .ntp = config.ntp, .status_timeout = config.sync.status_timeout};
  const utc_time::mcp::Dispatcher dispatcher(utc_time::mcp::build_registry(context), context);
  const utc_time::sinks::HealthExporter exporter(&monitor, config.sync.status_timeout);
  const utc_time::http::Router router(dispatcher, exporter, std::move(api_keys),
                                      utc_time::http::RouterOptions{.container_mode = config.http.only});

  std::unique_ptr<utc_time::http::HttpServer> http_server;
  if (config.http.enabled) {
    http_server = std::make_unique<utc_time::http::HttpServer>(
        utc_time::http::HttpServerOptions{.bind_address = config.http.bind_address,
                                          .port = config.http.port,
                                          .handler_threads = config.http.threads,
                                          .request_timeout = config.http.request_timeout},
        router);
    try {
      http_server->start();
    } catch (const std::exception& ex) {
      utc_time::core::log_error("http", ex.what());
      http_server.reset();
    }
  }

  if (config.http.only) {
    if (!http_server) {
      utc_time::core::log_error("server", "http-only mode without a running HTTP server; exiting");
      return 1;
    }

    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    utc_time::core::log_info("server", "shutdown signal received; exiting cleanly");
    http_server->stop();
    return 0;
  }

  const utc_time::mcp::Server stdio_server(dispatcher);
  const int status = stdio_server.run(std::cin, std::cout);
  if (http_server) {
    http_server->stop();
  }
  return status;
}
