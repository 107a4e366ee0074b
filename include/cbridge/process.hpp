#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbridge {

namespace fs = std::filesystem;

struct command_spec {
  std::vector<std::string> argv;
  fs::path cwd;  // empty: inherit
  std::optional<std::chrono::milliseconds> timeout;
};

struct command_result {
  int exit_code{-1};
  std::string out;
  std::string err;
  bool timed_out{};
  std::string error;  // spawn or wait failure, empty otherwise

  bool ok() const { return exit_code == 0 && !timed_out && error.empty(); }
};

// Spawn argv[0] (looked up on PATH) and collect both output streams.  A
// non-zero exit, a spawn failure or a timeout are all reported in the
// result, never thrown.
command_result run_command(const command_spec& spec);

// Everything that launches programs takes one of these, so tests can
// substitute a scripted runner.
using command_runner = std::function<command_result(const command_spec&)>;

// Empty path when name cannot be resolved.
fs::path find_executable(std::string_view name);

std::string describe(const command_spec& spec);

}  // namespace cbridge
