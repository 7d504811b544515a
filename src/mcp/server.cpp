#include "mcp/server.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/log.hpp"
#include "mcp/jsonrpc.hpp"

namespace utc_time::mcp {

namespace {

constexpr const char* kTag = "server";

bool is_blank(const std::string& line) noexcept {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

Server::Server(const Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

int Server::run(std::istream& in, std::ostream& out) const {
  std::string line;
  while (std::getline(in, line)) {
    if (is_blank(line)) {
      continue;
    }

    std::optional<std::string> response;
    try {
      response = dispatcher_.handle_message(line);
    } catch (const std::exception& ex) {
      core::log_error(kTag, std::string("failed to process request: ") + ex.what());
      response = make_error_response(recover_id_from_text(line),
                                     JsonRpcError{.code = kInternalError, .message = "Internal error"})
                     .dump();
    }

    if (!response.has_value()) {
      continue;
    }
    out << *response << '\n';
    out.flush();
    if (!out) {
      core::log_error(kTag, "output channel closed; stopping");
      return 1;
    }
  }

  if (in.bad()) {
    core::log_error(kTag, "input channel failed");
    return 1;
  }
  core::log_info(kTag, "end of input; stopping");
  return 0;
}

}  // namespace utc_time::mcp
