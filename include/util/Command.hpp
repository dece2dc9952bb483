// Helpers for running the zfs/zpool command line tools
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace zfscheck::util {

struct CommandResult {
  bool started{false};   // popen succeeded
  int exit_code{-1};     // -1 when the child did not exit normally
  std::string output;    // stdout only; stderr goes to /dev/null

  [[nodiscard]] bool ok() const { return started && exit_code == 0; }
};

// Resolve a tool: env override, then PATH, then the usual sbin locations.
// Returns an empty string when nothing executable was found.
auto find_tool(const char* name, const char* env_override) -> std::string;

// Single-quote for /bin/sh.
auto shell_quote(std::string_view arg) -> std::string;

auto run_command(const std::string& tool, const std::vector<std::string>& args) -> CommandResult;

} // namespace zfscheck::util
