#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include "cbridge/process.hpp"

namespace cbridge {

struct policy_decision {
  bool allowed{};
  std::string reason;
};

// Default-deny lexical policy for run_shell_command.  Only a small
// read-only subset passes; compound commands and redirection never do.
policy_decision decide(std::string_view command);

// Policy check, then /bin/sh -c.  Returns {ok, exit_code, stdout, stderr},
// or {ok: false, denied: true, reason} without spawning anything.
boost::json::object run_shell_command(
    const std::string& command, const fs::path& cwd,
    std::chrono::seconds timeout, const command_runner& runner);

}  // namespace cbridge
