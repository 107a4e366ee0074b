#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbridge {

/// Reply synthesis for the conductor CLI.  Each function inspects the
/// assistant text of one turn; next_reply() applies them in priority order.

bool needs_yes_no(std::string_view text);

// Letter of the last "X. Type your own answer" line, if any.
std::optional<std::string> pick_choice_letter(std::string_view text);

// Every "X. something" line, trimmed, in order of appearance.
std::vector<std::string> choice_options(std::string_view text);

// The last non-blank line ends in '?' or matches a known prompt phrasing.
bool looks_like_question(std::string_view text);

std::string last_nonblank_line(std::string_view text);

std::string canned_answer(
    std::string_view question, const std::string& project_brief,
    const std::string& track_description);

enum class reply_kind { resend_brief, confirm, choose, answer, proceed };

struct reply {
  reply_kind kind;
  std::string text;

  // The text asked something a human could answer differently.
  bool asks_user() const {
    return kind == reply_kind::confirm || kind == reply_kind::choose ||
           kind == reply_kind::answer;
  }
};

reply next_reply(
    std::string_view assistant_text, const std::string& project_brief,
    const std::string& track_description);

}  // namespace cbridge
