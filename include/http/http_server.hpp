#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "http/router.hpp"

namespace utc_time::http {

struct HttpServerOptions {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t port{3000};
  std::size_t handler_threads{4};
  std::chrono::milliseconds request_timeout{5000};
};

// Asynchronous HTTP/1.1 listener. Socket I/O runs on one io_context thread;
// routing runs on a separate handler pool so a slow route never stalls
// accept or other connections. Each request is bounded by request_timeout.
class HttpServer {
 public:
  HttpServer(HttpServerOptions options, const Router& router);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts serving. Throws std::runtime_error when the address
  // cannot be bound.
  void start();
  void stop();

  // Actual listening port; differs from the option when it was 0.
  [[nodiscard]] std::uint16_t port() const noexcept { return bound_port_; }

 private:
  void do_accept();

  HttpServerOptions options_;
  const Router& router_;
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool handler_pool_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::uint16_t bound_port_{0};
};

}  // namespace utc_time::http
