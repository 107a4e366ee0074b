#include "cbridge/autopilot.hpp"

#include <fmt/format.h>

#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <vector>

#include "cbridge/state.hpp"
#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

constexpr std::string_view gitignore_text = R"(# Secrets
.env
.env.*
!.env.example

# OS junk
.DS_Store
Thumbs.db

# Dependencies / caches
node_modules/
.venv/
__pycache__/
.pytest_cache/
)";

command_result git(
    const command_runner& runner, const fs::path& dir,
    std::vector<std::string> args) {
  args.insert(args.begin(), "git");
  return runner({std::move(args), dir, std::nullopt});
}

std::string first_line(std::string_view text) {
  return std::string{text.substr(0, text.find('\n'))};
}

}  // namespace

json::object project_info::to_json() const {
  json::object obj;
  obj["project_dir"] = project_dir.string();
  obj["repo_name"] = repo_name;
  obj["remote_url"] = remote_url;
  obj["artifacts_dir"] = artifacts_dir.string();
  return obj;
}

std::string slugify(std::string_view text, std::size_t max_len) {
  std::string res;
  bool pending_dash = false;
  for (unsigned char c : utils::trim(text)) {
    if (std::isalnum(c) && c < 0x80) {
      if (pending_dash && !res.empty()) res += '-';
      pending_dash = false;
      res += static_cast<char>(std::tolower(c));
    } else {
      pending_dash = true;
    }
  }
  if (res.size() > max_len) res.resize(max_len);
  while (!res.empty() && res.back() == '-') res.pop_back();
  return res.empty() ? "project" : res;
}

std::string slug_timestamp() {
  std::time_t t = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  return fmt::format(
      "{:04}{:02}{:02}-{:02}{:02}{:02}", tm.tm_year + 1900, tm.tm_mon + 1,
      tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
}

project_info create_project(
    const command_runner& runner, const std::string& idea,
    const std::string& name, const fs::path& root_dir,
    std::string_view visibility, const fs::path& artifacts_subdir) {
  if (visibility != "public" && visibility != "private" &&
      visibility != "internal")
    throw std::invalid_argument{
      "visibility must be one of: public, private, internal"};

  fs::create_directories(root_dir);
  auto base_slug = slugify(name.empty() ? first_line(idea) : name);
  auto timestamp = slug_timestamp();

  project_info info{};
  info.project_dir = root_dir / fmt::format("{}-{}", timestamp, base_slug);
  if (!fs::create_directory(info.project_dir))
    utils::throwf("Project directory already exists: {}",
                  info.project_dir.string());

  atomic_write(
      info.project_dir / "README.md",
      fmt::format("# {}\n\n## Idea\n\n{}\n", base_slug, utils::trim(idea)));
  atomic_write(info.project_dir / ".gitignore", gitignore_text);
  info.artifacts_dir = info.project_dir / artifacts_subdir;
  fs::create_directories(info.artifacts_dir);
  atomic_write(info.artifacts_dir / ".keep", "");

  const auto& dir = info.project_dir;
  LOG_INFO("Scaffolded {}", dir.string());
  if (!git(runner, dir, {"init"}).ok()) throw std::runtime_error{"git init failed"};
  if (!git(runner, dir, {"checkout", "-b", "main"}).ok())
    LOG_WARN("git checkout -b main failed in {}", dir.string());
  if (!git(runner, dir, {"add", "."}).ok())
    LOG_WARN("git add failed in {}", dir.string());
  if (!git(runner, dir, {"commit", "-m", "chore: initial project scaffold"}).ok())
    throw std::runtime_error{
      "git commit failed (is your git user.name/user.email set?)"};

  info.repo_name = base_slug;
  auto view = runner(
      {{"gh", "repo", "view", info.repo_name, "--json", "name,url"}, dir, {}});
  if (view.ok()) info.repo_name = fmt::format("{}-{}", base_slug, timestamp);

  auto create = runner(
      {{"gh", "repo", "create", info.repo_name,
        fmt::format("--{}", visibility), "--source=.", "--remote=origin",
        "--push"},
       dir,
       {}});
  if (!create.ok()) {
    auto why = utils::trim(create.err);
    if (why.empty()) why = utils::trim(create.out);
    if (why.empty()) why = create.error;
    utils::throwf("gh repo create failed: {}", why);
  }

  auto remote = git(runner, dir, {"remote", "get-url", "origin"});
  if (!remote.ok())
    throw std::runtime_error{
      "Failed to read git remote URL after repo creation"};
  info.remote_url = utils::trim(remote.out);
  LOG_INFO("Created {} ({})", info.repo_name, info.remote_url);
  return info;
}

json::object push_branch(
    const command_runner& runner, const fs::path& repo_dir,
    const std::string& message, const std::string& branch_prefix) {
  std::error_code ec;
  if (!fs::is_directory(repo_dir, ec))
    utils::throwf("Repo dir not found: {}", repo_dir.string());

  auto status = git(runner, repo_dir, {"status", "--porcelain"});
  if (!status.ok()) throw std::runtime_error{"git status failed"};

  json::object res;
  res["ok"] = true;
  if (utils::trim(status.out).empty()) {
    res["pushed"] = false;
    res["reason"] = "no changes";
    return res;
  }

  auto branch = fmt::format("{}/{}", branch_prefix, slug_timestamp());
  if (!git(runner, repo_dir, {"checkout", "-b", branch}).ok())
    throw std::runtime_error{"git checkout -b failed"};
  if (!git(runner, repo_dir, {"add", "-A"}).ok())
    LOG_WARN("git add -A failed in {}", repo_dir.string());
  if (!git(runner, repo_dir, {"commit", "-m", message}).ok())
    throw std::runtime_error{"git commit failed"};
  if (!git(runner, repo_dir, {"push", "-u", "origin", branch}).ok())
    throw std::runtime_error{"git push failed"};

  LOG_INFO("Pushed {} from {}", branch, repo_dir.string());
  res["pushed"] = true;
  res["branch"] = branch;
  return res;
}

}  // namespace cbridge
