#include "stdio.hpp"

#include <boost/json.hpp>
#include <optional>
#include <string>

#include "cbridge/jsonrpc.hpp"
#include "../libcbridge/logger.hpp"

namespace json = boost::json;

namespace cbridge {

/// Server loop

void run_stdio_server(router& rpc, std::istream& in, std::ostream& out) {
  const std::string session_id{"stdio"};
  LOG_INFO("conductor-bridge --stdio: ready");

  for (;;) {
    std::optional<frame> f;
    try {
      f = read_frame(in);
    } catch (const frame_error& e) {
      LOG_WARN("dropping undecodable message: {}", e.what());
      continue;
    }
    if (!f) break;

    std::optional<json::value> resp;
    try {
      resp = rpc.handle(f->payload, session_id);
    } catch (const std::exception& e) {
      LOG_ERROR("router failed: {}", e.what());
      continue;
    }
    if (!resp) {
      LOG_DEBUG("nothing to send back");
      continue;
    }

    out << encode_frame(*resp, f->kind);
    out.flush();
    LOG_DEBUG(
        "sent {} reply", f->kind == framing::lsp ? "Content-Length" : "line");
  }

  LOG_INFO("stdio session ended");
}

}  // namespace cbridge
