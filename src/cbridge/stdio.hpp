#pragma once

#include <istream>
#include <ostream>

#include "cbridge/router.hpp"

namespace cbridge {

// Serve MCP over a pair of streams.  Each message is answered in the framing
// it arrived in (Content-Length headers or one JSON document per line), in
// receipt order.  Blocks until `in` reaches EOF.
void run_stdio_server(router& rpc, std::istream& in, std::ostream& out);

}  // namespace cbridge
