#include "cbridge/driver.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <boost/json.hpp>
#include <fstream>
#include <iterator>
#include <utility>

#include "cbridge/heuristics.hpp"
#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

constexpr std::size_t raw_tail_chars = 2000;
constexpr std::string_view setup_done_step = "3.3_initial_track_generated";

// The question a paused run hands back: the last line ending in '?', else
// the last non-blank line.
std::string trailing_question(std::string_view text) {
  std::string res;
  std::string_view rest = text;
  while (!rest.empty()) {
    auto nl = rest.find('\n');
    auto line = utils::trim(rest.substr(0, nl));
    if (!line.empty() && line.back() == '?') res = line;
    if (nl == std::string_view::npos) break;
    rest.remove_prefix(nl + 1);
  }
  return res.empty() ? last_nonblank_line(text) : res;
}

std::string rstrip(std::string_view s) {
  auto e = s.find_last_not_of(" \t\r\n");
  if (e == std::string_view::npos) return {};
  return std::string{s.substr(0, e + 1)};
}

}  // namespace

/// stream_parser

std::optional<stream_event> stream_parser::next() {
  while (!rest_.empty()) {
    auto nl = rest_.find('\n');
    auto line = utils::trim(rest_.substr(0, nl));
    rest_.remove_prefix(nl == std::string_view::npos ? rest_.size() : nl + 1);

    if (line.empty() || line.front() != '{') continue;
    boost::system::error_code ec;
    auto jv = json::parse(line, ec);
    if (ec || !jv.is_object()) continue;
    const auto& obj = jv.get_object();
    const auto* type = obj.if_contains("type");
    if (!type || !type->is_string()) continue;

    const auto& t = type->get_string();
    auto str_field = [&](std::string_view key) -> std::optional<std::string> {
      const auto* v = obj.if_contains(key);
      if (!v || v->is_null()) return std::nullopt;
      if (const auto* s = v->if_string()) return std::string{*s};
      return json::serialize(*v);
    };

    if (t == "init") {
      auto sid = str_field("session_id");
      if (sid && !sid->empty()) return init_event{*sid};
    } else if (t == "message") {
      const auto* content = obj.if_contains("content");
      if (content && content->is_string())
        return message_event{
          str_field("role").value_or(""),
          std::string{content->get_string()}};
    } else if (t == "result") {
      return result_event{str_field("status").value_or("")};
    }
  }
  return std::nullopt;
}

turn_outcome parse_turn(std::string raw, int exit_code) {
  turn_outcome res{};
  std::string text;
  stream_parser parser{raw};
  while (auto ev = parser.next()) {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, init_event>) {
            res.session_id = e.session_id;
          } else if constexpr (std::is_same_v<T, message_event>) {
            if (e.role == "assistant") text += e.content;
          } else {
            if (!e.status.empty() && e.status != "success")
              res.error = fmt::format("result_status={}", e.status);
          }
        },
        *ev);
  }
  res.assistant_text = utils::trim(text);
  res.ok = exit_code == 0 && !res.error;
  res.raw = std::move(raw);
  return res;
}

/// Free helpers

std::set<std::string> snapshot_tree(const fs::path& root, const fs::path& base) {
  std::set<std::string> res;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return res;
  for (fs::recursive_directory_iterator
           it{root, fs::directory_options::skip_permission_denied, ec},
       end;
       !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (it->is_regular_file(fec))
      res.insert(it->path().lexically_relative(base).generic_string());
  }
  return res;
}

std::optional<std::string> read_setup_step(const fs::path& repo) {
  std::ifstream f{repo / "conductor" / "setup_state.json"};
  if (!f) return std::nullopt;
  std::string text{
    std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
  boost::system::error_code ec;
  auto jv = json::parse(text, ec);
  if (ec || !jv.is_object()) return std::nullopt;
  auto step = get_string(jv.get_object(), "last_successful_step");
  if (!step || step->empty()) return std::nullopt;
  return step;
}

json::object to_json(const run_result& r, std::size_t transcript_tail) {
  json::object obj;
  obj["ok"] = r.ok;
  obj["model"] = r.model;
  obj["session_id"] = optional_to_json(r.session_id);
  obj["created_paths"] = strings_to_json(r.created_paths);
  obj["error"] = optional_to_json(r.error);
  obj["paused_for_user"] = r.paused_for_user;
  obj["user_prompt"] = optional_to_json(r.user_prompt);
  obj["user_choices"] = strings_to_json(r.user_choices);
  obj["transcript_tail"] = utils::tail(r.transcript, transcript_tail);
  return obj;
}

/// conductor_driver

conductor_driver::conductor_driver(
    std::vector<std::string> cli_command, command_runner runner)
    : cli_command_{std::move(cli_command)}, runner_{std::move(runner)} {}

std::vector<std::string> conductor_driver::turn_argv(
    const driver_options& opts, const std::optional<std::string>& session_id,
    const std::string& prompt) const {
  std::vector<std::string> argv{cli_command_};
  argv.insert(
      argv.end(), {"--output-format", "stream-json", "--approval-mode",
                   opts.approval_mode, "--model", opts.model, "--extensions",
                   "conductor"});
  if (session_id) {
    argv.emplace_back("--resume");
    argv.push_back(*session_id);
  }
  argv.push_back(prompt);
  return argv;
}

turn_outcome conductor_driver::run_turn(
    const fs::path& repo, const driver_options& opts,
    const std::optional<std::string>& session_id, const std::string& prompt) {
  auto r = runner_({turn_argv(opts, session_id, prompt), repo, opts.turn_timeout});
  if (r.timed_out) return {false, session_id, {}, {}, "turn_timeout"};
  if (!r.error.empty()) return {false, session_id, {}, {}, r.error};
  return parse_turn(r.out + r.err, r.exit_code);
}

run_result conductor_driver::run_flow(
    const fs::path& repo, const fs::path& watched, const driver_options& opts,
    std::string prompt, std::optional<std::string> session_id,
    const done_predicate& done) {
  auto start = std::chrono::steady_clock::now();
  auto before = snapshot_tree(watched, repo);
  run_result res{};
  res.model = opts.model;

  auto finish = [&](bool ok, std::optional<std::string> error) {
    res.ok = ok;
    res.error = std::move(error);
    res.session_id = session_id;
    auto after = snapshot_tree(watched, repo);
    std::set_difference(
        after.begin(), after.end(), before.begin(), before.end(),
        std::back_inserter(res.created_paths));
    LOG_INFO(
        "Conductor run finished: ok={} error={} created={}", res.ok,
        res.error.value_or("none"), res.created_paths.size());
    return std::move(res);
  };

  const int max_turns = std::max(1, opts.max_turns);
  for (int turn = 0; turn < max_turns; ++turn) {
    if (done()) return finish(true, std::nullopt);
    if (std::chrono::steady_clock::now() - start > opts.timeout)
      return finish(false, "timeout");

    LOG_INFO("Turn {}: {}", turn + 1, utils::tail(prompt, 120));
    auto t = run_turn(repo, opts, session_id, prompt);
    if (t.session_id) session_id = t.session_id;

    res.transcript += fmt::format("[user] {}\n", prompt);
    if (!t.assistant_text.empty())
      res.transcript += rstrip(t.assistant_text) + "\n";
    if (t.error) res.transcript += fmt::format("[gemini_error] {}\n", *t.error);
    if (!t.raw.empty() && t.assistant_text.empty())
      res.transcript += utils::tail(t.raw, raw_tail_chars) + "\n";

    if (done()) return finish(true, std::nullopt);
    if (!t.ok && t.error && t.assistant_text.empty())
      return finish(false, t.error);

    auto next = next_reply(
        t.assistant_text, opts.project_brief, opts.track_description);
    if (!opts.auto_answer && next.asks_user()) {
      res.paused_for_user = true;
      res.user_prompt = trailing_question(t.assistant_text);
      res.user_choices = choice_options(t.assistant_text);
      LOG_INFO("Paused for user: {}", res.user_prompt.value_or(""));
      return finish(false, std::nullopt);
    }
    LOG_DEBUG("Reply: {}", utils::tail(next.text, 120));
    prompt = std::move(next.text);
  }
  return finish(false, "max_turns_exceeded");
}

run_result conductor_driver::run_setup(
    const fs::path& repo, const driver_options& opts) {
  return run_flow(
      repo, repo / "conductor", opts, "/conductor:setup", std::nullopt,
      [&repo] { return read_setup_step(repo) == setup_done_step; });
}

run_result conductor_driver::run_new_track(
    const fs::path& repo, const driver_options& opts) {
  auto tracks = repo / "conductor" / "tracks";
  auto before = snapshot_tree(tracks, repo);
  return run_flow(
      repo, tracks, opts,
      fmt::format("/conductor:newTrack \"{}\"", opts.track_description),
      std::nullopt, [&] {
        auto now = snapshot_tree(tracks, repo);
        return std::any_of(now.begin(), now.end(), [&](const auto& p) {
          return before.count(p) == 0;
        });
      });
}

run_result conductor_driver::continue_session(
    const fs::path& repo, const std::string& session_id,
    const std::string& user_input, const driver_options& opts,
    done_predicate done) {
  auto watched = repo / "conductor";
  if (!done) {
    done = [watched, repo, before = snapshot_tree(watched, repo)] {
      auto now = snapshot_tree(watched, repo);
      return std::any_of(now.begin(), now.end(), [&](const auto& p) {
        return before.count(p) == 0;
      });
    };
  }
  return run_flow(repo, watched, opts, user_input, session_id, done);
}

}  // namespace cbridge
