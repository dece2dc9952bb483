#include "util/Command.hpp"
#include "util/Debug.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace zfscheck::util {

static bool executable(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

auto find_tool(const char* name, const char* env_override) -> std::string {
  if (env_override) {
    const char* v = std::getenv(env_override);
    if (v && *v) return std::string(v);
  }
  if (const char* path = std::getenv("PATH")) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (executable(cand)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  for (const char* dir : {"/sbin", "/usr/sbin", "/usr/local/sbin", "/bin", "/usr/bin"}) {
    std::string cand = std::string(dir) + "/" + name;
    if (executable(cand)) return cand;
  }
  return {};
}

auto shell_quote(std::string_view arg) -> std::string {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

auto run_command(const std::string& tool, const std::vector<std::string>& args) -> CommandResult {
  CommandResult res;
  std::string cmd = shell_quote(tool);
  for (const auto& a : args) { cmd += ' '; cmd += shell_quote(a); }
  if (debug_enabled()) std::fprintf(stderr, "zfscheck: Command: %s\n", cmd.c_str());
  cmd += " 2>/dev/null";

  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    std::fprintf(stderr, "zfscheck: Command: failed to start %s\n", tool.c_str());
    return res;
  }
  res.started = true;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) res.output.append(buf, n);
  int status = ::pclose(fp);
  if (status != -1 && WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  if (debug_enabled()) std::fprintf(stderr, "zfscheck: Command: exit %d, %zu bytes\n", res.exit_code, res.output.size());
  return res;
}

} // namespace zfscheck::util
