#pragma once

#include <filesystem>
#include <optional>
#include <span>

namespace cbridge {

struct server_options {
  bool http{false};
  bool stdio{false};
  unsigned short port{8765};
  std::filesystem::path state_dir{"state"};
  int max_connections{16};
  int loglevel{3};
};

// Returns an exit code when the program should stop right away (--help,
// bad usage), nullopt otherwise.
std::optional<int> parse_options(std::span<char*> args, server_options& opts);

}  // namespace cbridge
