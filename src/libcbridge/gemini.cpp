#include "cbridge/gemini.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

std::string context_line(const std::string& context) {
  return context.empty() ? std::string{} : fmt::format("Context: {}", context);
}

}  // namespace

gemini_client::gemini_client(
    fs::path gemini_path, command_runner runner, std::chrono::seconds timeout)
    : path_{std::move(gemini_path)},
      runner_{std::move(runner)},
      timeout_{timeout} {}

generation gemini_client::run_prompt(
    const std::string& prompt, const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) const {
  if (!available()) return {false, "Gemini CLI is not available"};

  std::vector<std::string> argv{path_.string()};
  if (model && !model->empty()) {
    argv.emplace_back("--model");
    argv.push_back(*model);
  }
  for (const auto& e : extensions) {
    argv.emplace_back("--extensions");
    argv.push_back(e);
  }
  argv.emplace_back("-p");
  argv.push_back(prompt);

  auto r = runner_({std::move(argv), {}, timeout_});
  if (r.timed_out)
    return {
      false,
      fmt::format("Command timed out after {} seconds", timeout_.count())};
  if (!r.error.empty()) return {false, fmt::format("Exception: {}", r.error)};
  if (r.exit_code != 0) {
    LOG_WARN("gemini exited with {}", r.exit_code);
    return {false, fmt::format("Error (exit {}): {}", r.exit_code, r.err)};
  }
  return {true, std::move(r.out)};
}

std::optional<std::string> gemini_client::version() const {
  if (!available()) return std::nullopt;
  auto r = runner_({{path_.string(), "--version"}, {}, std::chrono::seconds{10}});
  if (!r.ok()) return std::nullopt;
  return utils::trim(r.out);
}

bool gemini_client::has_conductor_extension() const {
  if (!available()) return false;
  auto r = runner_(
      {{path_.string(), "extensions", "list"}, {}, std::chrono::seconds{30}});
  std::string out = r.out;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out.find("conductor") != std::string::npos;
}

generation gemini_client::generate_spec(
    const std::string& task_description, const std::string& context,
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) const {
  return run_prompt(
      fmt::format(
          R"(You are a requirements agent. Write a concise specification for the task below.

Task: {}

{}

Write a structured spec with:
1. Summary
2. Goals and non-goals
3. Requirements
4. Acceptance criteria (bullet list)
5. Open questions

Output only the spec, in markdown format.)",
          task_description, context_line(context)),
      model, extensions);
}

generation gemini_client::generate_plan(
    const std::string& task_description, const std::string& context,
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) const {
  return run_prompt(
      fmt::format(
          R"(You are a planning agent. Create a detailed implementation plan.

Task: {}

{}

Write a structured plan with:
1. Goal summary
2. Step-by-step implementation steps
3. Expected deliverables
4. Potential issues to watch for

Output the plan in markdown format.)",
          task_description, context_line(context)),
      model, extensions);
}

generation gemini_client::generate_review(
    const std::string& plan, const std::string& implementation,
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) const {
  return run_prompt(
      fmt::format(
          R"(You are a code review agent. Review this implementation against the plan.

## Original Plan
{}

## Implementation Summary
{}

Provide:
1. Completion assessment (what was done vs planned)
2. Quality observations
3. Suggested improvements
4. Next steps

Output in markdown format.)",
          plan, implementation),
      model, extensions);
}

}  // namespace cbridge
