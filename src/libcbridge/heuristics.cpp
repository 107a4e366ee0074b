#include "cbridge/heuristics.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string>
#include <vector>

#include "utils.hpp"

namespace cbridge {

namespace {

std::string lowercase(std::string_view s) {
  std::string res{s};
  std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return res;
}

template <typename Keys>
bool contains_any(const std::string& haystack, const Keys& keys) {
  return std::any_of(keys.begin(), keys.end(), [&](std::string_view k) {
    return haystack.find(k) != std::string::npos;
  });
}

bool contains_any(
    const std::string& haystack, std::initializer_list<std::string_view> keys) {
  return contains_any<std::initializer_list<std::string_view>>(haystack, keys);
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

enum class answer_source { fixed, brief, track };

// A rule fires when the question mentions any of `keywords` and, when
// `qualifiers` is non-empty, also any of those.
struct canned_rule {
  std::vector<std::string_view> keywords;
  std::vector<std::string_view> qualifiers;
  answer_source source;
  std::string_view text;
};

// clang-format off
const std::array<canned_rule, 7> canned_rules{{ // NOLINT
  {{"track"}, {"description", "brief"}, answer_source::track, {}},
  {{"users", "audience"}, {}, answer_source::fixed,
   "Anyone who wants a quick laugh; non-developers; kids/teens."},
  {{"tech", "technology", "stack", "language"}, {}, answer_source::fixed,
   "Plain HTML + CSS + JavaScript (no frameworks, no build step)."},
  {{"workflow"}, {}, answer_source::fixed,
   "Keep it simple: implement, manually test in browser, then commit."},
  {{"goal", "vision"}, {}, answer_source::fixed,
   "A tiny funny web app that makes letters 'grow' when added to themselves."},
  {{"guidelines", "tone", "brand", "design"}, {}, answer_source::fixed,
   "Playful but clear. Big readable text. Friendly error messages."},
  {{"brownfield", "existing project"}, {}, answer_source::brief, {}},
}};
// clang-format on

}  // namespace

bool needs_yes_no(std::string_view text) {
  return contains_any(
      lowercase(text), {"(yes/no)", "yes/no", "do you approve", "confirm"});
}

std::optional<std::string> pick_choice_letter(std::string_view text) {
  static const RE2 own_answer_re{R"(^\s*([A-Z])\.\s*Type your own answer\s*$)"};
  std::optional<std::string> res;
  for_each_line(text, [&](std::string_view line) {
    std::string letter;
    if (RE2::FullMatch(line, own_answer_re, &letter)) res = letter;
  });
  return res;
}

std::vector<std::string> choice_options(std::string_view text) {
  static const RE2 option_re{R"(^\s*[A-Z]\.\s*\S.*$)"};
  std::vector<std::string> res;
  for_each_line(text, [&](std::string_view line) {
    if (RE2::FullMatch(line, option_re)) res.push_back(utils::trim(line));
  });
  return res;
}

std::string last_nonblank_line(std::string_view text) {
  std::string res;
  for_each_line(text, [&](std::string_view line) {
    auto t = utils::trim(line);
    if (!t.empty()) res = std::move(t);
  });
  return res;
}

bool looks_like_question(std::string_view text) {
  auto tail = last_nonblank_line(text);
  if (tail.empty()) return false;
  if (tail.back() == '?') return true;
  return contains_any(
      lowercase(tail),
      {"please provide", "please enter", "does this", "is this correct",
       "what would you like to do", "please suggest any changes"});
}

std::string canned_answer(
    std::string_view question, const std::string& project_brief,
    const std::string& track_description) {
  auto lowered = lowercase(question);
  for (const auto& rule : canned_rules) {
    if (!contains_any(lowered, rule.keywords)) continue;
    if (!rule.qualifiers.empty() && !contains_any(lowered, rule.qualifiers))
      continue;
    switch (rule.source) {
      case answer_source::fixed:
        return std::string{rule.text};
      case answer_source::brief:
        return project_brief;
      case answer_source::track:
        return track_description;
    }
  }
  return project_brief;
}

reply next_reply(
    std::string_view assistant_text, const std::string& project_brief,
    const std::string& track_description) {
  if (utils::trim(assistant_text).empty())
    return {reply_kind::resend_brief, project_brief};
  if (needs_yes_no(assistant_text)) return {reply_kind::confirm, "yes"};
  if (auto letter = pick_choice_letter(assistant_text))
    return {reply_kind::choose, *letter};
  if (looks_like_question(assistant_text))
    return {
      reply_kind::answer,
      canned_answer(assistant_text, project_brief, track_description)};
  return {reply_kind::proceed, "continue"};
}

}  // namespace cbridge
