#include "http/http_server.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "core/log.hpp"

namespace utc_time::http {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

constexpr const char* kTag = "http";
constexpr std::uint32_t kBodyLimit = 1024U * 1024U;

class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(tcp::socket&& socket, const Router& router, net::thread_pool& handler_pool,
          const std::chrono::milliseconds timeout)
      : stream_(std::move(socket)),
        deadline_(stream_.get_executor()),
        router_(router),
        handler_pool_(handler_pool),
        timeout_(timeout) {}

  void run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::do_read, shared_from_this()));
  }

 private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(kBodyLimit);
    stream_.expires_after(timeout_);
    beast_http::async_read(stream_, buffer_, *parser_,
                           beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(const beast::error_code& ec, std::size_t /*bytes*/) {
    if (ec == beast_http::error::end_of_stream) {
      close();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        core::log_debug(kTag, "read failed: " + ec.message());
      }
      return;
    }

    request_ = parser_->release();
    responded_ = false;
    stream_.expires_never();

    deadline_.expires_after(timeout_);
    deadline_.async_wait([self = shared_from_this()](const beast::error_code& wait_ec) {
      if (wait_ec || self->responded_) {
        return;
      }
      core::log_warn(kTag, "request " + std::string(self->request_.target().data(), self->request_.target().size()) +
                               " exceeded its deadline");
      self->send(make_timeout_response(self->request_.version()));
    });

    // The request is copied so a timed-out handler can finish safely.
    auto request = std::make_shared<Request>(request_);
    net::post(handler_pool_, [self = shared_from_this(), request]() {
      auto response = self->router_.handle(*request);
      net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
        if (self->responded_) {
          return;
        }
        self->deadline_.cancel();
        self->send(std::move(response));
      });
    });
  }

  void send(Response response) {
    responded_ = true;
    auto message = std::make_shared<Response>(std::move(response));
    stream_.expires_after(timeout_);
    beast_http::async_write(stream_, *message,
                            [self = shared_from_this(), message](const beast::error_code& ec, std::size_t) {
                              self->on_write(message->need_eof(), ec);
                            });
  }

  void on_write(const bool close_after, const beast::error_code& ec) {
    if (ec) {
      core::log_debug(kTag, "write failed: " + ec.message());
      return;
    }
    if (close_after) {
      close();
      return;
    }
    do_read();
  }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  net::steady_timer deadline_;
  beast::flat_buffer buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  Request request_;
  const Router& router_;
  net::thread_pool& handler_pool_;
  std::chrono::milliseconds timeout_;
  bool responded_{false};
};

}  // namespace

HttpServer::HttpServer(HttpServerOptions options, const Router& router)
    : options_(std::move(options)),
      router_(router),
      acceptor_(net::make_strand(io_context_)),
      handler_pool_(options_.handler_threads == 0 ? 1 : options_.handler_threads) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
  if (running_.exchange(true)) {
    return;
  }

  beast::error_code ec;
  const auto address = net::ip::make_address(options_.bind_address, ec);
  if (ec) {
    running_ = false;
    throw std::runtime_error("invalid bind address " + options_.bind_address + ": " + ec.message());
  }
  const tcp::endpoint endpoint{address, options_.port};
  const auto where = options_.bind_address + ":" + std::to_string(options_.port);

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    beast::error_code ignored;
    acceptor_.close(ignored);
    running_ = false;
    throw std::runtime_error("failed to listen on " + where + ": " + ec.message());
  }

  bound_port_ = acceptor_.local_endpoint(ec).port();
  do_accept();
  io_thread_ = std::thread([this]() { io_context_.run(); });
  core::log_info(kTag, "listening on " + options_.bind_address + ":" + std::to_string(bound_port_));
}

void HttpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  net::post(acceptor_.get_executor(), [this]() {
    beast::error_code ignored;
    acceptor_.close(ignored);
  });
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  handler_pool_.join();
  core::log_info(kTag, "stopped");
}

void HttpServer::do_accept() {
  acceptor_.async_accept(net::make_strand(io_context_), [this](const beast::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        core::log_warn(kTag, "accept failed: " + ec.message());
      }
    } else {
      std::make_shared<Session>(std::move(socket), router_, handler_pool_, options_.request_timeout)->run();
    }
    if (acceptor_.is_open()) {
      do_accept();
    }
  });
}

}  // namespace utc_time::http
