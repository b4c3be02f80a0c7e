#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace teamfs {

// Runs one store command (team, member, task, send, inbox, backends).
// Prints the JSON result on stdout. Returns the process exit code:
// 0 on success, 2 for a retryable lock timeout, 1 for any other failure.
int run_cli(const Config& cfg, const std::string& cmd, const std::vector<std::string>& args);

} // namespace teamfs
