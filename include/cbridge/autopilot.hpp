#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "cbridge/process.hpp"

namespace cbridge {

namespace fs = std::filesystem;

struct project_info {
  fs::path project_dir;
  std::string repo_name;
  std::string remote_url;
  fs::path artifacts_dir;

  boost::json::object to_json() const;
};

// Lowercase, runs of non-alphanumerics collapsed to '-', trimmed, at most
// max_len characters.  "project" when nothing is left.
std::string slugify(std::string_view text, std::size_t max_len = 40);

// UTC "YYYYmmdd-HHMMSS".
std::string slug_timestamp();

// Scaffold <root_dir>/<timestamp>-<slug> with a README, .gitignore and an
// artifacts directory, commit it on main and publish it with "gh repo
// create".  Throws std::runtime_error when a step fails.
project_info create_project(
    const command_runner& runner, const std::string& idea,
    const std::string& name, const fs::path& root_dir,
    std::string_view visibility = "public",
    const fs::path& artifacts_subdir = ".conductor-bridge/artifacts");

// Commit every change on a fresh <branch_prefix>/<timestamp> branch and push
// it to origin.  A clean tree is not an error: {pushed: false}.
boost::json::object push_branch(
    const command_runner& runner, const fs::path& repo_dir,
    const std::string& message = "Auto update",
    const std::string& branch_prefix = "auto");

}  // namespace cbridge
