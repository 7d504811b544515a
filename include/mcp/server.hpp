#pragma once

#include <iosfwd>

#include "mcp/dispatcher.hpp"

namespace utc_time::mcp {

// Line-delimited JSON-RPC over a stream pair. Requests are handled one at a
// time in arrival order.
class Server {
 public:
  explicit Server(const Dispatcher& dispatcher);

  // Returns 0 at end of input and 1 when the output channel fails.
  int run(std::istream& in, std::ostream& out) const;

 private:
  const Dispatcher& dispatcher_;
};

}  // namespace utc_time::mcp
