#pragma once

#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cbridge/config.hpp"
#include "cbridge/gemini.hpp"
#include "cbridge/process.hpp"
#include "cbridge/state.hpp"

namespace cbridge {

// Raised by bridge::call_tool for a name that is not in the catalog.
class unknown_tool_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// "<!-- conductor-bridge: model=M extensions=E -->" plus a blank line.
std::string artifact_header(
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions);

// Drop anything before the first markdown heading.  Text without a heading
// is returned unchanged.
std::string strip_markdown_preface(std::string_view text);

/// The tool catalog.  Each tool takes a JSON object of arguments (checked
/// against its schema: no unknown keys, required keys present, declared
/// kinds) and returns a JSON object.  Failures surface as exceptions.
class bridge {
 public:
  bridge(state_store& store, bridge_config cfg, command_runner runner);

  bridge(const bridge&) = delete;
  bridge(bridge&&) = delete;
  bridge& operator=(const bridge&) = delete;
  bridge& operator=(bridge&&) = delete;
  ~bridge() = default;

  // [{name, description, inputSchema}, ...]
  boost::json::array tools_list() const;

  boost::json::object call_tool(
      std::string_view name, const boost::json::object& arguments);

  state_store& store() { return *store_; }
  const bridge_config& config() const { return cfg_; }

 private:
  struct tool_entry;
  static const std::vector<tool_entry>& registry();

  using json_object = boost::json::object;

  json_object tool_ping(const json_object& args);
  json_object tool_get_status(const json_object& args);
  json_object tool_get_state(const json_object& args);
  json_object tool_set_state(const json_object& args);
  json_object tool_append_event(const json_object& args);
  json_object tool_get_events(const json_object& args);
  json_object tool_run_shell_command(const json_object& args);
  json_object tool_get_artifacts(const json_object& args);
  json_object tool_read_artifact(const json_object& args);
  json_object tool_write_artifact(const json_object& args);
  json_object tool_autopilot_create_project(const json_object& args);
  json_object tool_autopilot_push_branch(const json_object& args);
  json_object tool_conductor_setup(const json_object& args);
  json_object tool_conductor_new_track(const json_object& args);
  json_object tool_conductor_continue(const json_object& args);
  json_object tool_generate_spec(const json_object& args);
  json_object tool_generate_plan(const json_object& args);
  json_object tool_submit_handoff(const json_object& args);
  json_object tool_generate_review(const json_object& args);
  json_object tool_run_cycle(const json_object& args);
  json_object tool_pause(const json_object& args);
  json_object tool_resume(const json_object& args);

  json_object conductor_flow(const json_object& args, bool setup);
  bool paused() const;

  void put_artifact(
      const std::string& name, std::string_view content,
      const std::optional<std::string>& artifacts_dir);
  std::optional<std::string> get_artifact(
      const std::string& name,
      const std::optional<std::string>& artifacts_dir) const;

  state_store* store_;
  bridge_config cfg_;
  command_runner runner_;
  gemini_client gemini_;
};

}  // namespace cbridge
