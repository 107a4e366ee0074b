#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "cbridge/process.hpp"

namespace cbridge {

namespace fs = std::filesystem;

struct implementation_result {
  bool ok{};
  std::string summary;
};

// Back-end that turns a plan into changes in a working directory.
class implementer {
 public:
  implementer() = default;
  implementer(const implementer&) = delete;
  implementer(implementer&&) = delete;
  implementer& operator=(const implementer&) = delete;
  implementer& operator=(implementer&&) = delete;
  virtual ~implementer() = default;

  virtual std::string_view name() const = 0;
  virtual bool available() const = 0;
  virtual implementation_result implement(
      const std::string& plan, const fs::path& working_dir) = 0;
};

// "simulate", "codex_cli" or "claude_cli".  Throws std::invalid_argument
// for anything else.
std::unique_ptr<implementer> make_implementer(
    std::string_view name, command_runner runner);

// First available of codex_cli, claude_cli, simulate.
std::unique_ptr<implementer> best_available_implementer(command_runner runner);

}  // namespace cbridge
