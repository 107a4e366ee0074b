#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbridge {

namespace fs = std::filesystem;

inline constexpr std::string_view default_conductor_model =
    "gemini-3-flash-preview";

// Split a comma list, dropping blanks.
std::vector<std::string> parse_extensions_list(std::string_view comma_list);

struct bridge_config {
  fs::path state_dir{"state"};
  std::optional<std::string> gemini_model;
  std::optional<std::string> gemini_extensions;  // raw comma list
  fs::path workdir{"."};
  fs::path projects_dir;
  fs::path gemini_path;  // empty: CLI unavailable
  // Program prefix for conductor turns.  Defaults to the gemini path.
  std::vector<std::string> conductor_cli;

  std::vector<std::string> extensions() const {
    return parse_extensions_list(gemini_extensions.value_or(""));
  }

  // Reads the CONDUCTOR_BRIDGE_* variables.  state_dir is left at its
  // default; the command line owns it.
  static bridge_config from_environment();
};

}  // namespace cbridge
