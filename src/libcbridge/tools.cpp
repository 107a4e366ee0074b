#include "cbridge/tools.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>

#include "cbridge/autopilot.hpp"
#include "cbridge/driver.hpp"
#include "cbridge/implementer.hpp"
#include "cbridge/quality_gate.hpp"
#include "cbridge/shell_policy.hpp"
#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

constexpr std::size_t transcript_tail_chars = 4000;
constexpr std::string_view paused_message = "Loop is paused. Call resume() first.";

struct param {
  std::string_view name;
  std::string_view type;  // string, integer, boolean, object or array
  bool required{};
  std::vector<std::string_view> choices{};
};

json::object paused_error() {
  json::object obj;
  obj["error"] = paused_message;
  return obj;
}

json::object phase_payload(std::string_view phase) {
  json::object obj;
  obj["phase"] = phase;
  return obj;
}

json::object schema_of(const std::vector<param>& params) {
  json::object props;
  json::array required;
  for (const auto& p : params) {
    json::object prop;
    prop["type"] = p.type;
    if (p.type == "array") prop["items"] = json::object{{"type", "string"}};
    if (p.type == "object") prop["additionalProperties"] = true;
    if (!p.choices.empty())
      prop["enum"] = json::array(p.choices.begin(), p.choices.end());
    props[p.name] = std::move(prop);
    if (p.required) required.emplace_back(p.name);
  }
  json::object schema;
  schema["type"] = "object";
  schema["properties"] = std::move(props);
  if (!required.empty()) schema["required"] = std::move(required);
  schema["additionalProperties"] = false;
  return schema;
}

bool kind_matches(std::string_view type, const json::value& v) {
  if (type == "string") return v.is_string();
  if (type == "integer") return v.is_int64() || v.is_uint64();
  if (type == "boolean") return v.is_bool();
  if (type == "object") return v.is_object();
  if (type == "array") {
    const auto* arr = v.if_array();
    return arr && std::all_of(arr->begin(), arr->end(), [](const auto& e) {
             return e.is_string();
           });
  }
  return false;
}

void check_arguments(
    std::string_view tool, const std::vector<param>& params,
    const json::object& args) {
  for (const auto& kv : args) {
    auto it = std::find_if(params.begin(), params.end(), [&](const auto& p) {
      return p.name == kv.key();
    });
    if (it == params.end())
      utils::throwf<std::invalid_argument>(
          "{}: unexpected argument '{}'", tool, std::string_view{kv.key()});
    if (kv.value().is_null()) continue;
    if (!kind_matches(it->type, kv.value()))
      utils::throwf<std::invalid_argument>(
          "{}: argument '{}' must be of type {}", tool, it->name, it->type);
    if (!it->choices.empty()) {
      std::string_view v = kv.value().get_string();
      if (std::find(it->choices.begin(), it->choices.end(), v) ==
          it->choices.end())
        utils::throwf<std::invalid_argument>(
            "{}: argument '{}' must be one of {}", tool, it->name,
            fmt::join(it->choices, ", "));
    }
  }
  for (const auto& p : params) {
    const auto* v = args.if_contains(p.name);
    if (p.required && (!v || v->is_null()))
      utils::throwf<std::invalid_argument>(
          "{}: missing required argument '{}'", tool, p.name);
  }
}

void require_program(std::string_view name) {
  if (find_executable(name).empty())
    utils::throwf("Required command not found in PATH: {}", name);
}

std::string revision_prompt(const std::vector<std::string>& issues) {
  std::string issues_text;
  for (const auto& i : issues) {
    if (!issues_text.empty()) issues_text += "\n";
    issues_text += fmt::format("- {}", i);
  }
  return fmt::format(
      "Quality gate failed for the generated track `spec.md`/`plan.md`.\n\n"
      "Fix the track's files now, WITHOUT adding extra scope.\n"
      "Hard requirements:\n"
      "- Spec must include: Non-goals/Out of Scope AND Acceptance Criteria "
      "(bullet list).\n"
      "- Spec must be final and clean (no 'wait/confusing/revised logic' or "
      "brainstorming).\n"
      "- Plan must be phased and contain checkbox tasks ('- [ ] Task: "
      "...').\n\n"
      "Issues found:\n{}\n\n"
      "When done, reply: DONE",
      issues_text);
}

driver_options options_from(
    const json::object& args, const bridge_config& cfg) {
  driver_options opts{};
  opts.model = get_string(args, "model")
                   .or_else([&] { return cfg.gemini_model; })
                   .value_or(std::string{default_conductor_model});
  opts.approval_mode = get_string(args, "approval_mode").value_or("yolo");
  opts.timeout = std::chrono::seconds{get_int(args, "timeout_s").value_or(900)};
  opts.max_turns = static_cast<int>(get_int(args, "max_turns").value_or(20));
  opts.auto_answer = get_bool(args, "auto_answer").value_or(true);
  opts.project_brief = get_string(args, "project_brief").value_or("");
  opts.track_description = get_string(args, "track_description").value_or("");
  return opts;
}

fs::path existing_repo(const json::object& args) {
  fs::path repo{require_string(args, "repo_dir")};
  std::error_code ec;
  if (!fs::is_directory(repo, ec))
    utils::throwf<std::invalid_argument>(
        "repo_dir is not a directory: {}", repo.string());
  return repo;
}

}  // namespace

/// Free functions

std::string artifact_header(
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) {
  return fmt::format(
      "<!-- conductor-bridge: model={} extensions={} -->\n\n",
      model && !model->empty() ? *model : "default",
      extensions.empty() ? std::string{"default"}
                         : fmt::format("{}", fmt::join(extensions, ",")));
}

std::string strip_markdown_preface(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    auto line = text.substr(
        pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    auto first = line.find_first_not_of(" \t\r");
    if (first != std::string_view::npos && line[first] == '#') {
      auto rest = text.substr(pos + first);
      auto end = rest.find_last_not_of(" \t\r\n");
      return std::string{rest.substr(0, end + 1)} + "\n";
    }
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  return std::string{text};
}

/// Catalog

struct bridge::tool_entry {
  std::string_view name;
  std::string_view description;
  std::vector<param> params;
  json::object (bridge::*handler)(const json::object&);
};

const std::vector<bridge::tool_entry>& bridge::registry() {
  const std::vector<std::string_view> approval_modes{
    "default", "auto_edit", "yolo"};
  const std::vector<std::string_view> profiles{"auto", "micro", "project"};
  const std::vector<param> doc_params{
    {"task_description", "string", true},
    {"context", "string"},
    {"model", "string"},
    {"extensions", "array"},
    {"artifacts_dir", "string"},
  };
  const std::vector<param> conductor_params{
    {"repo_dir", "string", true},
    {"project_brief", "string", true},
    {"track_description", "string", true},
    {"model", "string"},
    {"approval_mode", "string", false, approval_modes},
    {"timeout_s", "integer"},
    {"max_turns", "integer"},
    {"auto_answer", "boolean"},
    {"quality_profile", "string", false, profiles},
    {"quality_retries", "integer"},
  };

  // clang-format off
  static const std::vector<tool_entry> entries{
    {"ping", "Health check for conductor-bridge.", {}, &bridge::tool_ping},
    {"get_status", "Return tool + environment status.", {},
     &bridge::tool_get_status},
    {"get_state", "Read the current bridge state.", {},
     &bridge::tool_get_state},
    {"set_state", "Merge a partial update into bridge state.",
     {{"partial_update", "object", true}}, &bridge::tool_set_state},
    {"append_event", "Append an event to the event log (state/events.jsonl).",
     {{"type", "string"}, {"payload", "object"}}, &bridge::tool_append_event},
    {"get_events", "Return the most recent events, oldest first.",
     {{"limit", "integer"}}, &bridge::tool_get_events},
    {"run_shell_command",
     "Run a read-only shell command (allow-listed; compound commands and "
     "redirection are refused).",
     {{"command", "string", true}, {"cwd", "string"}, {"timeout_s", "integer"}},
     &bridge::tool_run_shell_command},
    {"get_artifacts",
     "Read spec.md, plan.md, handoff.md, and review.md from artifacts.",
     {{"artifacts_dir", "string"}}, &bridge::tool_get_artifacts},
    {"read_artifact", "Read one artifact by name.",
     {{"name", "string", true}, {"artifacts_dir", "string"}},
     &bridge::tool_read_artifact},
    {"write_artifact",
     "Write an artifact under state/artifacts (e.g. plan.md, handoff.md, "
     "review.md).",
     {{"name", "string", true}, {"content", "string", true},
      {"artifacts_dir", "string"}},
     &bridge::tool_write_artifact},
    {"autopilot_create_project",
     "Create a new local project folder + GitHub repo (pushes main).",
     {{"idea", "string", true}, {"name", "string"}, {"root_dir", "string"},
      {"visibility", "string", false, {"public", "private", "internal"}},
      {"artifacts_subdir", "string"}},
     &bridge::tool_autopilot_create_project},
    {"autopilot_push_branch",
     "Create a new branch, commit all changes, and push to origin.",
     {{"repo_dir", "string", true}, {"message", "string"},
      {"branch_prefix", "string"}},
     &bridge::tool_autopilot_push_branch},
    {"conductor_setup",
     "Run Gemini CLI Conductor `/conductor:setup` inside a repo to generate "
     "`conductor/` markdown files.",
     conductor_params, &bridge::tool_conductor_setup},
    {"conductor_new_track",
     "Run Gemini CLI Conductor `/conductor:newTrack` inside a repo to "
     "generate track spec/plan files.",
     conductor_params, &bridge::tool_conductor_new_track},
    {"conductor_continue",
     "Continue a paused Conductor session with a user answer (e.g. 'A', 'B', "
     "'yes', 'no').",
     {{"repo_dir", "string", true}, {"session_id", "string", true},
      {"user_input", "string", true}, {"project_brief", "string"},
      {"track_description", "string"}, {"model", "string"},
      {"approval_mode", "string", false, approval_modes},
      {"timeout_s", "integer"}, {"max_turns", "integer"},
      {"auto_answer", "boolean"}},
     &bridge::tool_conductor_continue},
    {"generate_spec", "Ask Gemini to generate spec.md (requirements).",
     doc_params, &bridge::tool_generate_spec},
    {"generate_plan",
     "Ask Gemini to generate plan.md and advance the state to implementing.",
     doc_params, &bridge::tool_generate_plan},
    {"submit_handoff",
     "Write handoff.md and advance the state to awaiting_review.",
     {{"handoff_markdown", "string", true}, {"artifacts_dir", "string"}},
     &bridge::tool_submit_handoff},
    {"generate_review",
     "Ask Gemini to review handoff.md against plan.md; writes review.md and "
     "completes the cycle.",
     {{"plan", "string"}, {"implementation", "string"}, {"model", "string"},
      {"extensions", "array"}, {"artifacts_dir", "string"}},
     &bridge::tool_generate_review},
    {"run_cycle",
     "Run a full plan->implement->review cycle using an implementer backend.",
     {{"implementer", "string", false,
       {"simulate", "codex_cli", "claude_cli"}}},
     &bridge::tool_run_cycle},
    {"pause", "Pause the loop.", {}, &bridge::tool_pause},
    {"resume", "Resume the loop.", {}, &bridge::tool_resume},
  };
  // clang-format on
  return entries;
}

/// bridge

bridge::bridge(state_store& store, bridge_config cfg, command_runner runner)
    : store_{&store},
      cfg_{std::move(cfg)},
      runner_{std::move(runner)},
      gemini_{cfg_.gemini_path, runner_} {}

json::array bridge::tools_list() const {
  json::array res;
  for (const auto& e : registry()) {
    json::object t;
    t["name"] = e.name;
    t["description"] = e.description;
    t["inputSchema"] = schema_of(e.params);
    res.push_back(std::move(t));
  }
  return res;
}

json::object bridge::call_tool(
    std::string_view name, const json::object& arguments) {
  const auto& entries = registry();
  auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e) {
    return e.name == name;
  });
  if (it == entries.end())
    utils::throwf<unknown_tool_error>("Unknown tool: {}", name);

  check_arguments(it->name, it->params, arguments);
  LOG_INFO("tool {}", it->name);
  return (this->*(it->handler))(arguments);
}

bool bridge::paused() const { return store_->get().paused; }

void bridge::put_artifact(
    const std::string& name, std::string_view content,
    const std::optional<std::string>& artifacts_dir) {
  if (artifacts_dir && !artifacts_dir->empty())
    state_store::write_artifact_to(*artifacts_dir, name, content);
  else
    store_->write_artifact(name, content);
}

std::optional<std::string> bridge::get_artifact(
    const std::string& name,
    const std::optional<std::string>& artifacts_dir) const {
  if (artifacts_dir && !artifacts_dir->empty())
    return state_store::read_artifact_from(*artifacts_dir, name);
  return store_->read_artifact(name);
}

/// Basic tools

json::object bridge::tool_ping(const json::object& /*args*/) {
  json::object res;
  res["status"] = "ok";
  res["message"] = "conductor-bridge is running";
  return res;
}

json::object bridge::tool_get_status(const json::object& /*args*/) {
  json::array events;
  for (const auto& e : store_->get_events(10)) events.push_back(e.to_json());

  json::object res;
  res["state"] = store_->get().to_json();
  res["gemini_available"] = gemini_.available();
  res["gemini_path"] = gemini_.available()
                           ? json::value(gemini_.path().string())
                           : json::value(nullptr);
  res["gemini_version"] = optional_to_json(gemini_.version());
  res["gemini_model_configured"] = optional_to_json(cfg_.gemini_model);
  res["gemini_extensions_configured"] =
      optional_to_json(cfg_.gemini_extensions);
  res["conductor_installed"] = gemini_.has_conductor_extension();
  res["codex_available"] = make_implementer("codex_cli", runner_)->available();
  res["claude_available"] = make_implementer("claude_cli", runner_)->available();
  res["recent_events"] = std::move(events);
  return res;
}

json::object bridge::tool_get_state(const json::object& /*args*/) {
  return store_->get().to_json();
}

json::object bridge::tool_set_state(const json::object& args) {
  return store_->set(*get_object(args, "partial_update")).to_json();
}

json::object bridge::tool_append_event(const json::object& args) {
  return store_
      ->append_event(
          get_string(args, "type").value_or("unknown"),
          get_object(args, "payload").value_or(json::object{}))
      .to_json();
}

json::object bridge::tool_get_events(const json::object& args) {
  auto limit = get_int(args, "limit").value_or(100);
  if (limit < 0)
    throw std::invalid_argument{"'limit' must be a non-negative integer"};
  json::array events;
  for (const auto& e : store_->get_events(static_cast<std::size_t>(limit)))
    events.push_back(e.to_json());
  json::object res;
  res["events"] = std::move(events);
  return res;
}

json::object bridge::tool_run_shell_command(const json::object& args) {
  auto timeout_s = get_int(args, "timeout_s").value_or(60);
  if (timeout_s <= 0)
    throw std::invalid_argument{"'timeout_s' must be a positive integer"};
  return run_shell_command(
      require_string(args, "command"),
      fs::path{get_string(args, "cwd").value_or("")},
      std::chrono::seconds{timeout_s}, runner_);
}

json::object bridge::tool_get_artifacts(const json::object& args) {
  auto dir = get_string(args, "artifacts_dir");
  json::object res;
  res["spec"] = optional_to_json(get_artifact("spec.md", dir));
  res["plan"] = optional_to_json(get_artifact("plan.md", dir));
  res["handoff"] = optional_to_json(get_artifact("handoff.md", dir));
  res["review"] = optional_to_json(get_artifact("review.md", dir));
  return res;
}

json::object bridge::tool_read_artifact(const json::object& args) {
  auto name = require_string(args, "name");
  json::object res;
  res["content"] =
      optional_to_json(get_artifact(name, get_string(args, "artifacts_dir")));
  res["name"] = name;
  return res;
}

json::object bridge::tool_write_artifact(const json::object& args) {
  auto name = require_string(args, "name");
  auto dir = get_string(args, "artifacts_dir");
  put_artifact(name, require_string(args, "content"), dir);
  json::object res;
  res["ok"] = true;
  res["artifact"] = name;
  res["artifacts_dir"] = optional_to_json(dir);
  return res;
}

/// Autopilot

json::object bridge::tool_autopilot_create_project(const json::object& args) {
  require_program("git");
  require_program("gh");
  auto root = get_string(args, "root_dir");
  auto info = create_project(
      runner_, require_string(args, "idea"),
      get_string(args, "name").value_or(""),
      root && !root->empty() ? fs::path{*root} : cfg_.projects_dir,
      get_string(args, "visibility").value_or("public"),
      get_string(args, "artifacts_subdir")
          .value_or(".conductor-bridge/artifacts"));
  auto res = info.to_json();
  res["ok"] = true;
  return res;
}

json::object bridge::tool_autopilot_push_branch(const json::object& args) {
  require_program("git");
  json::object res;
  res["ok"] = true;
  res["result"] = push_branch(
      runner_, require_string(args, "repo_dir"),
      get_string(args, "message").value_or("Auto update"),
      get_string(args, "branch_prefix").value_or("auto"));
  return res;
}

/// Conductor

json::object bridge::conductor_flow(const json::object& args, bool setup) {
  auto repo = existing_repo(args);
  auto opts = options_from(args, cfg_);
  auto profile = get_string(args, "quality_profile").value_or("auto");
  auto retries = std::max<std::int64_t>(
      0, get_int(args, "quality_retries").value_or(2));

  conductor_driver driver{cfg_.conductor_cli, runner_};
  auto result =
      setup ? driver.run_setup(repo, opts) : driver.run_new_track(repo, opts);

  std::optional<gate_result> gate;
  if (result.ok) {
    gate = evaluate_track(repo, profile, opts.project_brief);
    std::set<std::string> created{
      result.created_paths.begin(), result.created_paths.end()};
    for (std::int64_t attempt = 0;
         !gate->ok && attempt < retries && result.session_id; ++attempt) {
      LOG_INFO(
          "Quality gate failed ({} issue(s)), revision {} of {}",
          gate->issues.size(), attempt + 1, retries);
      result = driver.continue_session(
          repo, *result.session_id, revision_prompt(gate->issues), opts,
          [&] { return evaluate_track(repo, profile, opts.project_brief).ok; });
      created.insert(result.created_paths.begin(), result.created_paths.end());
      result.created_paths.assign(created.begin(), created.end());
      if (result.paused_for_user) break;
      gate = evaluate_track(repo, profile, opts.project_brief);
    }
  }

  auto res = to_json(result, transcript_tail_chars);
  res["quality_gate"] = gate ? json::value(gate->to_json()) : json::value(nullptr);
  return res;
}

json::object bridge::tool_conductor_setup(const json::object& args) {
  return conductor_flow(args, true);
}

json::object bridge::tool_conductor_new_track(const json::object& args) {
  return conductor_flow(args, false);
}

json::object bridge::tool_conductor_continue(const json::object& args) {
  auto repo = existing_repo(args);
  auto opts = options_from(args, cfg_);
  conductor_driver driver{cfg_.conductor_cli, runner_};
  auto result = driver.continue_session(
      repo, require_string(args, "session_id"),
      require_string(args, "user_input"), opts);
  return to_json(result, transcript_tail_chars);
}

/// The plan, implement, review loop

namespace {

std::optional<std::string> chosen_model(
    const json::object& args, const bridge_config& cfg) {
  auto m = get_string(args, "model");
  if (m && !m->empty()) return m;
  return cfg.gemini_model;
}

std::vector<std::string> chosen_extensions(
    const json::object& args, const bridge_config& cfg) {
  auto list = get_string_list(args, "extensions");
  if (!list) return cfg.extensions();
  std::erase_if(*list, [](const auto& e) { return e.empty(); });
  return *list;
}

json::object document_result(
    std::string_view artifact, std::string_view key, const std::string& doc,
    const std::optional<std::string>& model,
    const std::vector<std::string>& extensions) {
  json::object res;
  res["ok"] = true;
  res["artifact"] = artifact;
  res[key] = doc;
  res["model"] = optional_to_json(model);
  res["extensions"] = strings_to_json(extensions);
  return res;
}

}  // namespace

json::object bridge::tool_generate_spec(const json::object& args) {
  if (paused()) return paused_error();

  auto task = require_string(args, "task_description");
  auto context = get_string(args, "context").value_or("");
  auto model = chosen_model(args, cfg_);
  auto extensions = chosen_extensions(args, cfg_);

  json::object update;
  update["phase"] = "planning";
  update["current_task"] = task;
  update["error"] = nullptr;
  store_->set(update);
  store_->append_event("phase_start", phase_payload("spec"));

  std::string content;
  if (gemini_.available()) {
    auto g = gemini_.generate_spec(task, context, model, extensions);
    content = g.ok ? strip_markdown_preface(g.text)
                   : fmt::format("# Spec (Gemini error)\n\n{}", g.text);
  } else {
    content = fmt::format("# Spec (Simulated)\n\n## Summary\n{}\n", task);
  }

  auto doc = artifact_header(model, extensions) + content;
  put_artifact("spec.md", doc, get_string(args, "artifacts_dir"));
  store_->append_event("phase_complete", phase_payload("spec"));
  return document_result("spec.md", "spec", doc, model, extensions);
}

json::object bridge::tool_generate_plan(const json::object& args) {
  if (paused()) return paused_error();

  auto task = require_string(args, "task_description");
  auto context = get_string(args, "context").value_or("");
  auto model = chosen_model(args, cfg_);
  auto extensions = chosen_extensions(args, cfg_);

  json::object update;
  update["phase"] = "planning";
  update["current_task"] = task;
  update["error"] = nullptr;
  store_->set(update);
  store_->append_event("phase_start", phase_payload("planning"));

  std::string content;
  if (gemini_.available()) {
    auto g = gemini_.generate_plan(task, context, model, extensions);
    content = g.ok ? strip_markdown_preface(g.text)
                   : fmt::format(
                         "# Plan (Gemini error)\n\n{}\n\n## Fallback Plan\n"
                         "1. Re-run generate_plan\n"
                         "2. If it keeps failing, write plan.md manually\n",
                         g.text);
  } else {
    content =
        "# Plan (Simulated)\n\n## Goal\nGenerate a plan artifact and proceed "
        "to implementation.\n\n## Steps\n1. Write plan.md\n2. Implement based "
        "on plan.md\n3. Write handoff.md\n4. Generate review.md\n";
  }

  auto doc = artifact_header(model, extensions) + content;
  put_artifact("plan.md", doc, get_string(args, "artifacts_dir"));
  store_->append_event("phase_complete", phase_payload("planning"));
  store_->set(phase_payload("implementing"));
  return document_result("plan.md", "plan", doc, model, extensions);
}

json::object bridge::tool_submit_handoff(const json::object& args) {
  if (paused()) return paused_error();

  json::object update = phase_payload("implementing");
  update["error"] = nullptr;
  store_->set(update);
  store_->append_event("phase_start", phase_payload("implementing"));
  put_artifact(
      "handoff.md", require_string(args, "handoff_markdown"),
      get_string(args, "artifacts_dir"));
  store_->append_event("phase_complete", phase_payload("implementing"));
  store_->set(phase_payload("awaiting_review"));

  json::object res;
  res["ok"] = true;
  res["artifact"] = "handoff.md";
  return res;
}

json::object bridge::tool_generate_review(const json::object& args) {
  if (paused()) return paused_error();

  auto dir = get_string(args, "artifacts_dir");
  auto plan = get_string(args, "plan")
                  .or_else([&] { return get_artifact("plan.md", dir); })
                  .value_or("");
  auto implementation =
      get_string(args, "implementation")
          .or_else([&] { return get_artifact("handoff.md", dir); })
          .value_or("");
  auto model = chosen_model(args, cfg_);
  auto extensions = chosen_extensions(args, cfg_);

  json::object update = phase_payload("awaiting_review");
  update["error"] = nullptr;
  store_->set(update);
  store_->append_event("phase_start", phase_payload("awaiting_review"));

  std::string content;
  if (gemini_.available()) {
    auto g = gemini_.generate_review(plan, implementation, model, extensions);
    content = g.ok ? strip_markdown_preface(g.text)
                   : fmt::format("# Review (Gemini error)\n\n{}", g.text);
  } else {
    content =
        "# Review (Simulated)\n\n## Summary\nGemini CLI was not available, so "
        "this review is simulated.\n";
  }

  auto doc = artifact_header(model, extensions) + content;
  put_artifact("review.md", doc, dir);
  store_->append_event("phase_complete", phase_payload("awaiting_review"));

  auto cycle = store_->update([](const bridge_state& current) {
                     auto next = phase_payload("planning");
                     next["cycle_count"] = current.cycle_count + 1;
                     next["current_task"] = nullptr;
                     return next;
                   }).cycle_count;
  json::object payload;
  payload["cycle"] = cycle;
  store_->append_event("cycle_complete", std::move(payload));

  auto res = document_result("review.md", "review", doc, model, extensions);
  res["cycle_completed"] = cycle;
  return res;
}

json::object bridge::tool_run_cycle(const json::object& args) {
  if (paused()) return paused_error();

  auto name = get_string(args, "implementer").value_or("simulate");
  json::array phases;
  auto phase_entry = [](std::string_view phase, bool success) {
    json::object p;
    p["name"] = phase;
    p["success"] = success;
    return p;
  };

  json::object plan_args;
  plan_args["task_description"] = "Create a simple demonstration task";
  plan_args["context"] = "Automated test cycle";
  auto plan_result = tool_generate_plan(plan_args);
  auto plan = get_string(plan_result, "plan").value_or("");
  phases.push_back(phase_entry("planning", true));

  json::object update = phase_payload("implementing");
  update["current_task"] = "Running implementation";
  store_->set(update);
  store_->append_event("phase_start", phase_payload("implementing"));

  auto impl = make_implementer(name, runner_);
  if (!impl->available()) {
    LOG_INFO("{} not available, falling back", impl->name());
    impl = best_available_implementer(runner_);
  }
  auto outcome = impl->implement(plan, cfg_.workdir);
  store_->write_artifact(
      "handoff.md",
      fmt::format(
          "# Implementation Handoff\n\n## Implementer Used\n{}\n\n## Result\n"
          "{}\n\n## Details\n{}\n",
          impl->name(), outcome.ok ? "Success" : "Failed", outcome.summary));
  auto payload = phase_payload("implementing");
  payload["implementer"] = impl->name();
  store_->append_event("phase_complete", std::move(payload));
  auto impl_phase = phase_entry("implementing", outcome.ok);
  impl_phase["implementer"] = impl->name();
  phases.push_back(std::move(impl_phase));

  json::object review_args;
  review_args["plan"] = plan;
  review_args["implementation"] = outcome.summary;
  auto review_result = tool_generate_review(review_args);
  phases.push_back(phase_entry("review", true));

  json::object res;
  res["phases"] = std::move(phases);
  res["cycle_completed"] = review_result.contains("cycle_completed")
                               ? review_result.at("cycle_completed")
                               : json::value(nullptr);
  return res;
}

json::object bridge::tool_pause(const json::object& /*args*/) {
  json::object update;
  update["paused"] = true;
  auto st = store_->set(update);
  store_->append_event("loop_paused");
  json::object res;
  res["paused"] = true;
  res["state"] = st.to_json();
  return res;
}

json::object bridge::tool_resume(const json::object& /*args*/) {
  json::object update;
  update["paused"] = false;
  auto st = store_->set(update);
  store_->append_event("loop_resumed");
  json::object res;
  res["paused"] = false;
  res["state"] = st.to_json();
  return res;
}

}  // namespace cbridge
