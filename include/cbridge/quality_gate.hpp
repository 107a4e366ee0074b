#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbridge {

namespace fs = std::filesystem;

struct gate_result {
  bool ok{};
  std::string profile;
  std::vector<std::string> issues;
  std::optional<std::string> track_id;

  boost::json::object to_json() const;
};

// File contents as UTF-8.  A UTF-8 BOM is dropped and UTF-16 (either
// byte order, BOM-marked) is transcoded.  Throws std::runtime_error if the
// file cannot be opened.
std::string read_text_auto(const fs::path& path);

// Last "(./conductor/tracks/<id>/)" link in conductor/tracks.md.
std::optional<std::string> detect_latest_track_id(const fs::path& repo);

// Structural checks of conductor/tracks/<id>/{spec,plan}.md.  `profile` is
// "auto", "micro" or "project"; auto means micro unless the repo has a
// package.json.
gate_result evaluate_track(
    const fs::path& repo, std::string_view profile = "auto",
    std::string_view user_brief = {},
    const std::optional<std::string>& track_id = std::nullopt);

}  // namespace cbridge
