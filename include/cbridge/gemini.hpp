#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cbridge/process.hpp"

namespace cbridge {

namespace fs = std::filesystem;

struct generation {
  bool ok{};
  std::string text;  // model output, or a description of the failure
};

// Single-shot "gemini -p" invocations.  An empty path means the CLI is not
// installed; every call then fails without spawning anything.
class gemini_client {
 public:
  gemini_client(
      fs::path gemini_path, command_runner runner,
      std::chrono::seconds timeout = std::chrono::seconds{120});

  bool available() const { return !path_.empty(); }
  const fs::path& path() const { return path_; }

  generation run_prompt(
      const std::string& prompt, const std::optional<std::string>& model = {},
      const std::vector<std::string>& extensions = {}) const;

  std::optional<std::string> version() const;
  bool has_conductor_extension() const;

  generation generate_spec(
      const std::string& task_description, const std::string& context,
      const std::optional<std::string>& model,
      const std::vector<std::string>& extensions) const;

  generation generate_plan(
      const std::string& task_description, const std::string& context,
      const std::optional<std::string>& model,
      const std::vector<std::string>& extensions) const;

  generation generate_review(
      const std::string& plan, const std::string& implementation,
      const std::optional<std::string>& model,
      const std::vector<std::string>& extensions) const;

 private:
  fs::path path_;
  command_runner runner_;
  std::chrono::seconds timeout_;
};

}  // namespace cbridge
