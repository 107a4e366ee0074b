#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cbridge/process.hpp"

namespace cbridge {

namespace fs = std::filesystem;

/// stream-json output of one CLI turn

struct init_event {
  std::string session_id;
};

struct message_event {
  std::string role;
  std::string content;
};

struct result_event {
  std::string status;
};

using stream_event = std::variant<init_event, message_event, result_event>;

// Lazily walks raw CLI output line by line.  Lines that are not JSON
// objects, or objects of an unknown type, are skipped.
class stream_parser {
 public:
  explicit stream_parser(std::string_view raw) : rest_{raw} {}

  std::optional<stream_event> next();

 private:
  std::string_view rest_;
};

struct turn_outcome {
  bool ok{};
  std::optional<std::string> session_id;
  std::string assistant_text;
  std::string raw;
  std::optional<std::string> error;
};

// Parse the combined output of one turn.  `exit_code` is folded into ok.
turn_outcome parse_turn(std::string raw, int exit_code);

/// The conductor session automaton

struct driver_options {
  std::string model;
  std::string approval_mode{"yolo"};
  std::chrono::seconds timeout{900};
  std::chrono::seconds turn_timeout{600};
  int max_turns{20};
  bool auto_answer{true};
  std::string project_brief;
  std::string track_description;
};

struct run_result {
  bool ok{};
  std::string model;
  std::optional<std::string> session_id;
  std::string transcript;
  std::vector<std::string> created_paths;
  std::optional<std::string> error;
  bool paused_for_user{};
  std::optional<std::string> user_prompt;
  std::vector<std::string> user_choices;
};

using done_predicate = std::function<bool()>;

// Relative (generic) paths of every regular file under root.
std::set<std::string> snapshot_tree(const fs::path& root, const fs::path& base);

class conductor_driver {
 public:
  // cli_command is the program prefix, e.g. {"gemini"} or
  // {"/bin/sh", "fake-cli.sh"}.
  conductor_driver(std::vector<std::string> cli_command, command_runner runner);

  run_result run_setup(const fs::path& repo, const driver_options& opts);
  run_result run_new_track(const fs::path& repo, const driver_options& opts);

  // Resume session_id with the caller's answer as the first prompt.  Without
  // a predicate, done means a new file appeared under conductor/.
  run_result continue_session(
      const fs::path& repo, const std::string& session_id,
      const std::string& user_input, const driver_options& opts,
      done_predicate done = {});

  std::vector<std::string> turn_argv(
      const driver_options& opts, const std::optional<std::string>& session_id,
      const std::string& prompt) const;

 private:
  run_result run_flow(
      const fs::path& repo, const fs::path& watched, const driver_options& opts,
      std::string prompt, std::optional<std::string> session_id,
      const done_predicate& done);

  turn_outcome run_turn(
      const fs::path& repo, const driver_options& opts,
      const std::optional<std::string>& session_id, const std::string& prompt);

  std::vector<std::string> cli_command_;
  command_runner runner_;
};

// Step recorded in conductor/setup_state.json, if any.
std::optional<std::string> read_setup_step(const fs::path& repo);

boost::json::object to_json(const run_result& r, std::size_t transcript_tail);

}  // namespace cbridge
