#include "cbridge/implementer.hpp"

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

constexpr std::size_t plan_excerpt_chars = 500;

class simulate_implementer : public implementer {
 public:
  std::string_view name() const override { return "simulate"; }
  bool available() const override { return true; }

  implementation_result implement(
      const std::string& plan, const fs::path& /*working_dir*/) override {
    auto excerpt = plan.substr(0, plan_excerpt_chars);
    if (plan.size() > plan_excerpt_chars) excerpt += "...";
    return {
      true, fmt::format(
                R"(# Implementation Summary (Simulated)

## Plan Received
{}

## Actions Taken (Simulated)
- Parsed the plan successfully
- Identified key implementation steps
- Created placeholder implementations
- Ran simulated tests (all passed)

## Files Modified (Simulated)
- src/feature.py - Added new feature code
- tests/test_feature.py - Added unit tests
- README.md - Updated documentation

## Status
Implementation simulated successfully. This is a test run.
)",
                excerpt)};
  }
};

// A coding-agent CLI driven with "<program> -p <prompt>" in the working
// directory.
class cli_implementer : public implementer {
 public:
  cli_implementer(
      std::string name, std::string label, std::string_view program,
      std::string prompt_tail, command_runner runner)
      : name_{std::move(name)},
        label_{std::move(label)},
        path_{find_executable(program)},
        prompt_tail_{std::move(prompt_tail)},
        runner_{std::move(runner)} {}

  std::string_view name() const override { return name_; }
  bool available() const override { return !path_.empty(); }

  implementation_result implement(
      const std::string& plan, const fs::path& working_dir) override {
    if (!available())
      return {false, fmt::format("{} CLI is not available", label_)};

    auto prompt = fmt::format(
        R"(Implement the following plan. Work in the current directory.

## Plan
{}

## Instructions
1. Read and understand the plan
2. Implement each step
3. Create/modify necessary files
4. Provide a summary of what was done{})",
        plan, prompt_tail_);

    LOG_INFO("Implementing with {} in {}", name_, working_dir.string());
    auto r = runner_({{path_.string(), "-p", prompt}, working_dir, timeout});
    if (r.timed_out)
      return {
        false, fmt::format("{} timed out after {}s", label_, timeout.count())};
    if (!r.error.empty())
      return {false, fmt::format("Exception: {}", r.error)};
    if (r.exit_code != 0)
      return {
        false,
        fmt::format("{} error (exit {}): {}", label_, r.exit_code, r.err)};
    return {true, std::move(r.out)};
  }

 private:
  static constexpr std::chrono::seconds timeout{300};

  std::string name_;
  std::string label_;
  fs::path path_;
  std::string prompt_tail_;
  command_runner runner_;
};

std::unique_ptr<implementer> make_codex(command_runner runner) {
  return std::make_unique<cli_implementer>(
      "codex_cli", "Codex", "codex",
      "\n\nBe concise and focus on the implementation.", std::move(runner));
}

std::unique_ptr<implementer> make_claude(command_runner runner) {
  return std::make_unique<cli_implementer>(
      "claude_cli", "Claude", "claude", "", std::move(runner));
}

}  // namespace

std::unique_ptr<implementer> make_implementer(
    std::string_view name, command_runner runner) {
  if (name == "simulate") return std::make_unique<simulate_implementer>();
  if (name == "codex_cli") return make_codex(std::move(runner));
  if (name == "claude_cli") return make_claude(std::move(runner));
  utils::throwf<std::invalid_argument>(
      "Unknown implementer '{}'. Available: simulate, codex_cli, claude_cli",
      name);
}

std::unique_ptr<implementer> best_available_implementer(command_runner runner) {
  if (auto codex = make_codex(runner); codex->available()) return codex;
  if (auto claude = make_claude(runner); claude->available()) return claude;
  return std::make_unique<simulate_implementer>();
}

}  // namespace cbridge
