#include "cbridge/shell_policy.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <array>
#include <string>
#include <string_view>

#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

constexpr std::size_t max_command_length = 8000;

struct deny_rule {
  const RE2& re;
  std::string_view why;
};

const auto& deny_rules() {
  // clang-format off
  static const RE2 delete_re{R"((?i)\b(remove-item|del|erase|rm|rmdir|rd)\b)"};
  static const RE2 format_re{R"((?i)\b(format|mkfs(\.\w+)?)\b)"};
  static const RE2 diskpart_re{R"((?i)\bdiskpart\b)"};
  static const RE2 reg_re{R"((?i)\breg(\.exe)?\b)"};
  static const RE2 shutdown_re{R"((?i)\b(shutdown|reboot|restart-computer|stop-computer)\b)"};
  static const RE2 kill_re{R"((?i)\b(kill|pkill|killall|taskkill|stop-process)\b)"};
  static const RE2 eval_re{R"((?i)\b(eval|invoke-expression|iex)\b)"};
  static const RE2 git_clean_re{R"((?i)\bgit\s+clean\b)"};
  static const RE2 git_reset_re{R"((?i)\bgit\s+reset\s+--hard\b)"};
  static const RE2 git_push_re{R"((?i)\bgit\s+push\b)"};
  static const std::array<deny_rule, 10> rules{{
    {delete_re,    "delete files"},
    {format_re,    "format disk"},
    {diskpart_re,  "disk partitioning"},
    {reg_re,       "registry editing"},
    {shutdown_re,  "shutdown/restart"},
    {kill_re,      "kill processes"},
    {eval_re,      "execute dynamic code"},
    {git_clean_re, "destructive git clean"},
    {git_reset_re, "destructive git reset"},
    {git_push_re,  "git push"},
  }};
  // clang-format on
  return rules;
}

bool allow_listed(std::string_view cmd) {
  static const RE2 allow_re{
    R"((?i)^\s*(git\s+(status|diff|log|show|rev-parse|branch)|ls|dir|)"
    R"(get-childitem|get-content|type|cat|head|tail|wc|grep|select-string|)"
    R"(pwd)\b)"};
  return RE2::PartialMatch(cmd, allow_re);
}

}  // namespace

policy_decision decide(std::string_view command) {
  auto cmd = utils::trim(command);
  if (cmd.empty()) return {false, "command must be a non-empty string"};
  if (cmd.size() > max_command_length) return {false, "command too long"};

  // `sh -c` runs a second command after `&`, inside backticks and inside
  // `$(...)`.
  for (std::string_view tok : {"\n", "\r", ";", "&", "|", "`", "$("})
    if (cmd.find(tok) != std::string::npos)
      return {false, "compound commands are not allowed"};

  for (std::string_view tok : {">", "<"})
    if (cmd.find(tok) != std::string::npos)
      return {false, "redirection is not allowed"};

  for (const auto& rule : deny_rules())
    if (RE2::PartialMatch(cmd, rule.re))
      return {
        false,
        fmt::format("blocked potentially dangerous command ({})", rule.why)};

  if (allow_listed(cmd)) return {true, ""};
  return {false, "command not in allowlist"};
}

boost::json::object run_shell_command(
    const std::string& command, const fs::path& cwd,
    std::chrono::seconds timeout, const command_runner& runner) {
  boost::json::object res;
  auto decision = decide(command);
  if (!decision.allowed) {
    LOG_INFO("Denied shell command ({}): {}", decision.reason, command);
    res["ok"] = false;
    res["denied"] = true;
    res["reason"] = decision.reason;
    return res;
  }

  auto r = runner({{"/bin/sh", "-c", command}, cwd, timeout});
  res["ok"] = r.ok();
  res["exit_code"] = r.exit_code;
  res["stdout"] = r.out;
  if (r.timed_out)
    res["stderr"] = fmt::format("Timed out after {}s", timeout.count());
  else if (!r.error.empty())
    res["stderr"] = r.error;
  else
    res["stderr"] = r.err;
  return res;
}

}  // namespace cbridge
