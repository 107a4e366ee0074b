#include "options.hpp"

#include <CLI/CLI.hpp>

namespace cbridge {

std::optional<int> parse_options(std::span<char*> args, server_options& opts) {
  CLI::App app{"Conductor Bridge MCP server"};

  auto* transport = app.add_option_group("transport", "Choose exactly one");
  transport->add_flag("--http", opts.http, "Run as Streamable HTTP server");
  transport->add_flag("--stdio", opts.stdio, "Run as stdio MCP server");
  transport->require_option(1);

  app.add_option("--port", opts.port, "HTTP port")->capture_default_str();
  app.add_option("--state-dir", opts.state_dir, "State directory")
      ->envname("CONDUCTOR_BRIDGE_STATE_DIR")
      ->capture_default_str();
  app.add_option(
         "--max-connections", opts.max_connections,
         "Concurrent HTTP connections")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  app.add_option("-d, --debug", opts.loglevel, "Debug log level (3=INFO)")
      ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

}  // namespace cbridge
