#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include "cbridge/driver.hpp"
#include "scratch.hpp"
#include "test_config.h"

using namespace cbridge;

namespace {

conductor_driver fake_conductor() {
  return conductor_driver{
    {"/bin/sh", TEST_FIXTURE_DIR "/fake-conductor.sh"}, run_command};
}

driver_options quick_options() {
  driver_options opts;
  opts.model = "test-model";
  opts.timeout = std::chrono::seconds{60};
  opts.turn_timeout = std::chrono::seconds{20};
  opts.max_turns = 6;
  opts.project_brief = "A tiny app";
  opts.track_description = "Add a button";
  return opts;
}

bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

TEST_CASE("stream-parser-skips-noise") {
  stream_parser p{
    "Loaded cached credentials.\n"
    "{\"type\":\"init\",\"session_id\":\"abc\"}\n"
    "\n"
    "[1, 2]\n"
    "{\"type\":\"tool_use\",\"name\":\"x\"}\n"
    "{\"type\":\"message\",\"role\":\"assistant\",\"content\":\"Hi\"}\n"
    "{\"type\":\"message\",\"role\":\"assistant\",\"content\":{\"no\":1}}\n"
    "{\"type\":\"result\",\"status\":\"success\"}"};

  auto e1 = p.next();
  REQUIRE(e1.has_value());
  REQUIRE(std::holds_alternative<init_event>(*e1));
  CHECK(std::get<init_event>(*e1).session_id == "abc");

  auto e2 = p.next();
  REQUIRE(e2.has_value());
  REQUIRE(std::holds_alternative<message_event>(*e2));
  CHECK(std::get<message_event>(*e2).role == "assistant");
  CHECK(std::get<message_event>(*e2).content == "Hi");

  auto e3 = p.next();
  REQUIRE(e3.has_value());
  REQUIRE(std::holds_alternative<result_event>(*e3));
  CHECK(std::get<result_event>(*e3).status == "success");

  CHECK_FALSE(p.next().has_value());
}

TEST_CASE("parse-turn-joins-assistant-text") {
  auto t = parse_turn(
      "{\"type\":\"init\",\"session_id\":\"s9\"}\n"
      "{\"type\":\"message\",\"role\":\"user\",\"content\":\"ignored\"}\n"
      "{\"type\":\"message\",\"role\":\"assistant\",\"content\":\"Hello \"}\n"
      "{\"type\":\"message\",\"role\":\"assistant\",\"content\":\"world \"}\n"
      "{\"type\":\"result\",\"status\":\"success\"}\n",
      0);
  CHECK(t.ok);
  REQUIRE(t.session_id.has_value());
  CHECK(*t.session_id == "s9");
  CHECK(t.assistant_text == "Hello world");
  CHECK_FALSE(t.error.has_value());
}

TEST_CASE("parse-turn-failures") {
  auto t = parse_turn("{\"type\":\"result\",\"status\":\"error\"}\n", 0);
  CHECK_FALSE(t.ok);
  REQUIRE(t.error.has_value());
  CHECK(*t.error == "result_status=error");

  auto t2 = parse_turn("not json at all\n", 2);
  CHECK_FALSE(t2.ok);
  CHECK_FALSE(t2.error.has_value());
  CHECK(t2.raw == "not json at all\n");
}

TEST_CASE("turn-argv-shape") {
  conductor_driver d{{"gemini"}, run_command};
  auto opts = quick_options();
  auto argv = d.turn_argv(opts, std::nullopt, "/conductor:setup");
  std::vector<std::string> expected{
    "gemini",       "--output-format", "stream-json", "--approval-mode",
    "yolo",         "--model",         "test-model",  "--extensions",
    "conductor",    "/conductor:setup"};
  CHECK(argv == expected);

  auto resumed = d.turn_argv(opts, std::string{"s1"}, "yes");
  REQUIRE(resumed.size() == expected.size() + 2);
  CHECK(resumed[9] == "--resume");
  CHECK(resumed[10] == "s1");
  CHECK(resumed.back() == "yes");
}

TEST_CASE("driver-turn-timeout-ends-run") {
  scratch_dir tmp;
  int calls = 0;
  conductor_driver d{{"gemini"}, [&](const command_spec& spec) {
    ++calls;
    CHECK(spec.cwd == tmp.path);
    CHECK(spec.timeout == std::chrono::milliseconds{20000});
    command_result r{};
    r.timed_out = true;
    return r;
  }};
  auto res = d.run_setup(tmp.path, quick_options());
  CHECK(calls == 1);
  CHECK_FALSE(res.ok);
  REQUIRE(res.error.has_value());
  CHECK(*res.error == "turn_timeout");
}

TEST_CASE("driver-new-track-auto-answers") {
  scratch_dir tmp;
  auto d = fake_conductor();
  auto res = d.run_new_track(tmp.path, quick_options());

  CHECK(res.ok);
  CHECK_FALSE(res.error.has_value());
  CHECK(res.model == "test-model");
  REQUIRE(res.session_id.has_value());
  CHECK(*res.session_id == "sess-1");
  CHECK(has(res.created_paths, "conductor/tracks/t1/spec.md"));
  CHECK(has(res.created_paths, "conductor/tracks/t1/plan.md"));
  CHECK(res.transcript.find("[user] /conductor:newTrack \"Add a button\"") !=
        std::string::npos);
  CHECK(res.transcript.find("[user] yes") != std::string::npos);
  CHECK(slurp(tmp.path / ".fake-prompts") ==
        "/conductor:newTrack \"Add a button\"\nyes\n");
}

TEST_CASE("driver-setup-picks-own-answer-choice") {
  scratch_dir tmp;
  auto d = fake_conductor();
  auto res = d.run_setup(tmp.path, quick_options());

  CHECK(res.ok);
  CHECK(slurp(tmp.path / ".fake-prompts") == "/conductor:setup\nB\n");
  CHECK(has(res.created_paths, "conductor/setup_state.json"));
  REQUIRE(read_setup_step(tmp.path).has_value());
  CHECK(*read_setup_step(tmp.path) == "3.3_initial_track_generated");
}

TEST_CASE("driver-pauses-then-continues") {
  scratch_dir tmp;
  auto d = fake_conductor();
  auto opts = quick_options();
  opts.auto_answer = false;

  auto paused = d.run_new_track(tmp.path, opts);
  CHECK_FALSE(paused.ok);
  CHECK_FALSE(paused.error.has_value());
  CHECK(paused.paused_for_user);
  REQUIRE(paused.user_prompt.has_value());
  CHECK(*paused.user_prompt == "Proceed with creating the track? (yes/no)");
  REQUIRE(paused.session_id.has_value());
  CHECK(paused.created_paths.empty());

  auto resumed = d.continue_session(tmp.path, *paused.session_id, "yes", opts);
  CHECK(resumed.ok);
  CHECK(has(resumed.created_paths, "conductor/tracks.md"));
  CHECK(has(resumed.created_paths, "conductor/tracks/t1/plan.md"));
  CHECK(has(resumed.created_paths, "conductor/tracks/t1/spec.md"));

  auto j = to_json(resumed, 4000);
  CHECK(j.at("ok").as_bool());
  CHECK(j.at("session_id").as_string() == "sess-1");
  CHECK(j.at("user_prompt").is_null());
  CHECK(j.at("created_paths").as_array().size() == 3);
}

TEST_CASE("driver-max-turns-exceeded") {
  scratch_dir tmp;
  auto d = fake_conductor();
  auto opts = quick_options();
  opts.max_turns = 3;

  auto res = d.continue_session(
      tmp.path, "sess-1", "hello", opts, [] { return false; });
  CHECK_FALSE(res.ok);
  REQUIRE(res.error.has_value());
  CHECK(*res.error == "max_turns_exceeded");
  CHECK_FALSE(res.transcript.empty());
  CHECK(slurp(tmp.path / ".fake-prompts") == "hello\ncontinue\ncontinue\n");
}

TEST_CASE("driver-cli-error-stops-run") {
  scratch_dir tmp;
  auto d = fake_conductor();
  auto res = d.continue_session(
      tmp.path, "sess-1", "failing", quick_options(), [] { return false; });
  CHECK_FALSE(res.ok);
  REQUIRE(res.error.has_value());
  CHECK(*res.error == "result_status=error");
  CHECK(res.transcript.find("[gemini_error] result_status=error") !=
        std::string::npos);
}
