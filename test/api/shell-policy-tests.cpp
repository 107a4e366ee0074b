#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <string_view>

#include "cbridge/shell_policy.hpp"
#include "scratch.hpp"

using cbridge::decide;

TEST_CASE("shell-policy-allows-read-only-commands") {
  CHECK(decide("git status").allowed);
  CHECK(decide("  git diff --stat").allowed);
  CHECK(decide("GIT LOG -n 3").allowed);
  CHECK(decide("ls -la").allowed);
  CHECK(decide("cat README.md").allowed);
  CHECK(decide("pwd").allowed);
  CHECK(decide("grep -n foo src/main.cpp").allowed);
}

TEST_CASE("shell-policy-rejects-compound-commands") {
  auto d = decide("git status; rm -rf .");
  CHECK_FALSE(d.allowed);
  CHECK(d.reason == "compound commands are not allowed");

  CHECK_FALSE(decide("ls && pwd").allowed);
  CHECK_FALSE(decide("ls || pwd").allowed);
  CHECK_FALSE(decide("cat x | wc -l").allowed);
  CHECK_FALSE(decide("ls\npwd").allowed);
}

TEST_CASE("shell-policy-rejects-background-and-substitution") {
  for (std::string_view cmd :
       {"ls & touch x", "wc `touch x`", "ls $(touch x)", "cat $(id -u)"}) {
    auto d = decide(cmd);
    CHECK_FALSE(d.allowed);
    CHECK(d.reason == "compound commands are not allowed");
  }
}

TEST_CASE("shell-policy-rejects-redirection") {
  auto d = decide("cat secrets > out.txt");
  CHECK_FALSE(d.allowed);
  CHECK(d.reason == "redirection is not allowed");
  CHECK(decide("cat < in").reason == "redirection is not allowed");
}

TEST_CASE("shell-policy-denylist-wins-over-allowlist") {
  auto d = decide("git push origin main");
  CHECK_FALSE(d.allowed);
  CHECK(d.reason == "blocked potentially dangerous command (git push)");

  CHECK(
      decide("git reset --hard HEAD").reason ==
      "blocked potentially dangerous command (destructive git reset)");
  CHECK(
      decide("git clean -fdx").reason ==
      "blocked potentially dangerous command (destructive git clean)");
  CHECK(
      decide("cat foo rm").reason ==
      "blocked potentially dangerous command (delete files)");
  CHECK(
      decide("pkill gemini").reason ==
      "blocked potentially dangerous command (kill processes)");
}

TEST_CASE("shell-policy-default-denies") {
  CHECK(decide("make install").reason == "command not in allowlist");
  CHECK(decide("git commit -m x").reason == "command not in allowlist");
  CHECK(decide("   ").reason == "command must be a non-empty string");
  CHECK(decide(std::string(9000, 'a')).reason == "command too long");
}

TEST_CASE("shell-command-denied-never-spawns") {
  scratch_dir tmp;
  int calls = 0;
  cbridge::command_runner runner = [&](const cbridge::command_spec&) {
    ++calls;
    return cbridge::command_result{};
  };
  auto res = cbridge::run_shell_command(
      "git push", tmp.path, std::chrono::seconds{5}, runner);
  CHECK(calls == 0);
  CHECK_FALSE(res.at("ok").as_bool());
  CHECK(res.at("denied").as_bool());
  CHECK(res.at("reason").as_string() ==
        "blocked potentially dangerous command (git push)");
}

TEST_CASE("shell-command-allowed-runs-through-sh") {
  scratch_dir tmp;
  spit(tmp.path / "hello.txt", "hi there\n");
  auto res = cbridge::run_shell_command(
      "cat hello.txt", tmp.path, std::chrono::seconds{10},
      cbridge::run_command);
  CHECK(res.at("ok").as_bool());
  CHECK(res.at("exit_code").as_int64() == 0);
  CHECK(res.at("stdout").as_string() == "hi there\n");
  CHECK(res.at("stderr").as_string() == "");
}
