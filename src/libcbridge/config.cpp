#include "cbridge/config.hpp"

#include <cstdlib>

#include "cbridge/process.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace {

std::optional<std::string> env(const char* name) {
  const char* v = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
  if (!v || !*v) return std::nullopt;
  return std::string{v};
}

}  // namespace

std::vector<std::string> parse_extensions_list(std::string_view comma_list) {
  std::vector<std::string> res;
  while (!comma_list.empty()) {
    auto comma = comma_list.find(',');
    auto item = utils::trim(comma_list.substr(0, comma));
    if (!item.empty()) res.push_back(std::move(item));
    if (comma == std::string_view::npos) break;
    comma_list.remove_prefix(comma + 1);
  }
  return res;
}

bridge_config bridge_config::from_environment() {
  bridge_config cfg{};
  cfg.gemini_model = env("CONDUCTOR_BRIDGE_GEMINI_MODEL");
  cfg.gemini_extensions = env("CONDUCTOR_BRIDGE_GEMINI_EXTENSIONS");
  if (auto w = env("CONDUCTOR_BRIDGE_WORKDIR")) cfg.workdir = *w;

  if (auto p = env("CONDUCTOR_BRIDGE_PROJECTS_DIR"))
    cfg.projects_dir = *p;
  else if (auto home = env("HOME"))
    cfg.projects_dir = fs::path{*home} / "Downloads" / "codex-projects";
  else
    cfg.projects_dir = "codex-projects";

  if (auto g = env("CONDUCTOR_BRIDGE_GEMINI_PATH"))
    cfg.gemini_path = find_executable(*g);
  else
    cfg.gemini_path = find_executable("gemini");

  cfg.conductor_cli = {
    cfg.gemini_path.empty() ? std::string{"gemini"} : cfg.gemini_path.string()};

  LOG_DEBUG(
      "config: gemini={} model={} workdir={}",
      cfg.gemini_path.empty() ? "<none>" : cfg.gemini_path.string(),
      cfg.gemini_model.value_or("<default>"), cfg.workdir.string());
  return cfg;
}

}  // namespace cbridge
