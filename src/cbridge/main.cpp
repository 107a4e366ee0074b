#include <fmt/format.h>

#include <boost/json.hpp>
#include <cstdlib>
#include <iostream>
#include <span>
#include <typeinfo>

#include "../libcbridge/logger.hpp"
#include "../libcbridge/utils.hpp"
#include "cbridge/config.hpp"
#include "cbridge/process.hpp"
#include "cbridge/router.hpp"
#include "cbridge/session_hub.hpp"
#include "cbridge/state.hpp"
#include "cbridge/tools.hpp"
#include "options.hpp"
#include "stdio.hpp"
#include "web_server.hpp"

namespace cb = cbridge;
namespace json = boost::json;

int main(int argc, char* argv[]) {
  cb::server_options opts{};
  auto done = cb::parse_options(std::span(argv, argc), opts);
  if (done) return done.value();

  cb::logger::set_level(static_cast<cb::logger::level>(opts.loglevel));
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (const char* log = std::getenv("CONDUCTOR_BRIDGE_STDIO_LOG");
      log && *log && !cb::logger::set_log_file(log))
    LOG_WARN("can't open log file {}, logging to stderr", log);
  LOG_DEBUG("loglevel={}", opts.loglevel);

  try {
    auto cfg = cb::bridge_config::from_environment();
    cfg.state_dir = opts.state_dir;
    cb::state_store store{cfg.state_dir};
    cb::bridge bridge{store, cfg, cb::run_command};

    if (opts.stdio) {
      cb::router rpc{bridge};
      cb::run_stdio_server(rpc, std::cin, std::cout);
      return 0;
    }

    cb::session_hub hub;
    cb::router rpc{
      bridge, [&hub](const std::string& sid, const json::object& msg) {
        hub.publish(sid, json::serialize(msg));
      }};
    cb::web_server server{
      rpc, hub,
      {.port = opts.port, .max_connections = opts.max_connections}};

    fmt::println(
        "Conductor Bridge MCP server: http://127.0.0.1:{}/mcp", server.port());
    fmt::println("State directory: {}", cfg.state_dir.string());
    fmt::println("Press Ctrl+C to stop.");
    std::cout.flush();
    server.run();
  } catch (const std::exception& e) {
    LOG_FATAL(
        "{}: {}", cb::utils::demangle_symbol(typeid(e).name()), e.what());
    return 1;
  }
  return 0;
}
