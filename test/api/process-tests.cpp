#include <doctest/doctest.h>

#include <chrono>
#include <string>

#include "cbridge/process.hpp"
#include "scratch.hpp"

using cbridge::command_spec;
using cbridge::run_command;

TEST_CASE("process-collects-both-streams") {
  auto r = run_command(
      {{"/bin/sh", "-c", "printf out; printf err >&2"}, {}, std::nullopt});
  CHECK(r.ok());
  CHECK(r.exit_code == 0);
  CHECK(r.out == "out");
  CHECK(r.err == "err");
}

TEST_CASE("process-nonzero-exit-is-reported") {
  auto r = run_command({{"/bin/sh", "-c", "exit 3"}, {}, std::nullopt});
  CHECK_FALSE(r.ok());
  CHECK(r.exit_code == 3);
  CHECK(r.error.empty());
  CHECK_FALSE(r.timed_out);
}

TEST_CASE("process-runs-in-requested-dir") {
  scratch_dir tmp;
  spit(tmp.path / "marker", "here");
  auto r = run_command({{"cat", "marker"}, tmp.path, std::nullopt});
  CHECK(r.ok());
  CHECK(r.out == "here");
}

TEST_CASE("process-missing-executable") {
  auto r = run_command(
      {{"surely-not-a-real-program-xyz"}, {}, std::nullopt});
  CHECK_FALSE(r.ok());
  CHECK(r.exit_code == -1);
  CHECK(r.error == "executable not found: surely-not-a-real-program-xyz");

  CHECK(run_command({{}, {}, std::nullopt}).error == "empty command");
  CHECK(cbridge::find_executable("surely-not-a-real-program-xyz").empty());
  CHECK_FALSE(cbridge::find_executable("sh").empty());
}

TEST_CASE("process-timeout-kills-child") {
  auto start = std::chrono::steady_clock::now();
  auto r = run_command(
      {{"/bin/sh", "-c", "sleep 5"}, {}, std::chrono::milliseconds{200}});
  auto elapsed = std::chrono::steady_clock::now() - start;
  CHECK(r.timed_out);
  CHECK(r.exit_code == -1);
  CHECK_FALSE(r.ok());
  CHECK(elapsed < std::chrono::seconds{4});
}

TEST_CASE("process-describe") {
  command_spec spec{{"git", "status", "--short"}, {}, std::nullopt};
  CHECK(cbridge::describe(spec) == "git status --short");
}
