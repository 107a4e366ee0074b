#include "cbridge/quality_gate.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <re2/re2.h>

#include <algorithm>
#include <boost/locale/encoding_utf.hpp>
#include <array>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

// Ill-formed sequences (lone surrogates, a dangling odd byte) are dropped.
std::string utf16_to_utf8(std::string_view bytes, bool little_endian) {
  std::u16string units;
  units.reserve(bytes.size() / 2);
  for (std::size_t i = 0; i + 1 < bytes.size(); i += 2) {
    auto lo = static_cast<unsigned char>(bytes[little_endian ? i : i + 1]);
    auto hi = static_cast<unsigned char>(bytes[little_endian ? i + 1 : i]);
    units.push_back(static_cast<char16_t>((hi << 8) | lo));
  }
  return boost::locale::conv::utf_to_utf<char>(units);
}

template <typename F>
void for_each_line(std::string_view text, F&& f) {
  while (!text.empty()) {
    auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    f(line);
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }
}

std::string lowercase(std::string_view s) {
  std::string res{s};
  std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return res;
}

std::string heading_pattern(std::string_view heading) {
  return fmt::format(R"((?i)\s*##+\s*{}\s*)", RE2::QuoteMeta(heading));
}

bool has_heading(std::string_view md, std::string_view heading) {
  RE2 re{heading_pattern(heading)};
  bool found = false;
  for_each_line(md, [&](std::string_view line) {
    if (!found && RE2::FullMatch(line, re)) found = true;
  });
  return found;
}

// "- " bullets between the heading and the next "## " heading.
int count_bullets_in_section(std::string_view md, std::string_view heading) {
  static const RE2 next_heading_re{R"(\s*##+\s+.*)"};
  static const RE2 bullet_re{R"(\s*-\s+.*)"};
  RE2 heading_re{heading_pattern(heading)};

  enum { before, inside, after } where = before;
  int count = 0;
  for_each_line(md, [&](std::string_view line) {
    switch (where) {
      case before:
        if (RE2::FullMatch(line, heading_re)) where = inside;
        break;
      case inside:
        if (RE2::FullMatch(line, next_heading_re))
          where = after;
        else if (RE2::FullMatch(line, bullet_re))
          ++count;
        break;
      case after:
        break;
    }
  });
  return count;
}

bool any_line_matches(std::string_view text, const RE2& re) {
  bool found = false;
  for_each_line(text, [&](std::string_view line) {
    if (!found && RE2::PartialMatch(line, re)) found = true;
  });
  return found;
}

bool contains_thinking_out_loud(std::string_view md) {
  static const RE2 markers_re{
    R"(\bwait,|\bthis is confusing\b|\blet'?s re-?read\b|)"
    R"(\brevised logic\b|\bi will now\b)"};
  return RE2::PartialMatch(lowercase(md), markers_re);
}

void add_scope_creep_issues(
    std::vector<std::string>& issues, std::string_view md,
    std::string_view user_brief) {
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 6>
      creep{{
        {"subtraction", "Subtraction"},
        {"payments", "Payments"},
        {"invoic", "Invoicing"},
        {"kubernetes", "Kubernetes"},
        {"docker", "Docker"},
        {"rbac", "RBAC"},
      }};
  auto md_l = lowercase(md);
  auto brief_l = lowercase(user_brief);
  for (const auto& [needle, label] : creep) {
    if (md_l.find(needle) != std::string::npos &&
        brief_l.find(needle) == std::string::npos)
      issues.push_back(fmt::format(
          "Spec/plan mentions '{}' but it's not in the user brief (possible "
          "scope creep).",
          label));
  }
}

}  // namespace

json::object gate_result::to_json() const {
  json::object obj;
  obj["ok"] = ok;
  obj["profile"] = profile;
  obj["issues"] = strings_to_json(issues);
  obj["track_id"] = optional_to_json(track_id);
  return obj;
}

std::string read_text_auto(const fs::path& path) {
  std::ifstream f{path, std::ios::binary};
  if (!f) utils::throwf("cannot open {}", path.string());
  std::string data{
    std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};

  std::string_view v{data};
  if (v.starts_with("\xFF\xFE")) return utf16_to_utf8(v.substr(2), true);
  if (v.starts_with("\xFE\xFF")) return utf16_to_utf8(v.substr(2), false);
  if (v.starts_with("\xEF\xBB\xBF")) return std::string{v.substr(3)};
  return data;
}

std::optional<std::string> detect_latest_track_id(const fs::path& repo) {
  auto tracks_file = repo / "conductor" / "tracks.md";
  std::error_code ec;
  if (!fs::exists(tracks_file, ec)) return std::nullopt;

  static const RE2 link_re{R"(\(\./conductor/tracks/([^/]+)/\))"};
  auto text = read_text_auto(tracks_file);
  re2::StringPiece input{text};
  std::string id;
  std::optional<std::string> last;
  while (RE2::FindAndConsume(&input, link_re, &id)) last = id;
  return last;
}

gate_result evaluate_track(
    const fs::path& repo, std::string_view profile, std::string_view user_brief,
    const std::optional<std::string>& track_id) {
  if (profile != "auto" && profile != "micro" && profile != "project")
    utils::throwf<std::invalid_argument>(
        "quality_profile must be auto, micro or project (got '{}')", profile);

  gate_result res{};
  res.profile = std::string{profile};
  res.track_id = track_id ? track_id : detect_latest_track_id(repo);
  if (!res.track_id) {
    res.issues.emplace_back(
        "No track_id found (missing conductor/tracks.md?).");
    return res;
  }

  auto dir = repo / "conductor" / "tracks" / *res.track_id;
  std::error_code ec;
  std::vector<std::string> missing;
  for (const char* name : {"spec.md", "plan.md"})
    if (!fs::exists(dir / name, ec)) missing.emplace_back(name);
  if (!missing.empty()) {
    res.issues.push_back(fmt::format(
        "Missing track file(s): {}", fmt::join(missing, ", ")));
    return res;
  }

  auto spec = read_text_auto(dir / "spec.md");
  auto plan = read_text_auto(dir / "plan.md");

  if (profile == "auto")
    res.profile = fs::exists(repo / "package.json", ec) ? "project" : "micro";

  if (contains_thinking_out_loud(spec))
    res.issues.emplace_back(
        "Spec contains 'thinking out loud' / unresolved reasoning; it must be "
        "a clean, final spec.");
  if (contains_thinking_out_loud(plan))
    res.issues.emplace_back(
        "Plan contains meta-commentary; it must be a clean, final plan.");

  if (!has_heading(spec, "Non-goals") && !has_heading(spec, "Out of Scope"))
    res.issues.emplace_back(
        "Spec is missing a 'Non-goals' (or 'Out of Scope') section.");

  int ac_bullets = count_bullets_in_section(spec, "Acceptance Criteria");
  if (ac_bullets < (res.profile == "micro" ? 4 : 6))
    res.issues.push_back(fmt::format(
        "Spec acceptance criteria is too weak (found {} bullet(s)).",
        ac_bullets));

  static const RE2 phase_re{R"((?i)^\s*##\s*Phase\b)"};
  static const RE2 task_re{R"(^\s*-\s*\[\s*\]\s*Task:)"};
  if (!any_line_matches(plan, phase_re))
    res.issues.emplace_back(
        "Plan should be structured into 'Phase' sections (## Phase ...).");
  if (!any_line_matches(plan, task_re))
    res.issues.emplace_back(
        "Plan should contain checkbox tasks in the form '- [ ] Task: ...'.");

  add_scope_creep_issues(res.issues, spec, user_brief);
  add_scope_creep_issues(res.issues, plan, user_brief);

  res.ok = res.issues.empty();
  LOG_DEBUG(
      "Quality gate for track {}: {} issue(s)", *res.track_id,
      res.issues.size());
  return res;
}

}  // namespace cbridge
