#include "collectors/ZpoolScrubCollector.hpp"
#include "collectors/ZfsParsers.hpp"
#include "util/Command.hpp"

namespace zfscheck::collectors {

ZpoolScrubCollector::ZpoolScrubCollector()
    : tool_(util::find_tool("zpool", "ZFSCHECK_ZPOOL_PATH")) {}

bool ZpoolScrubCollector::pools(std::vector<std::string>& out) {
  if (tool_.empty()) { error_ = "zpool command not found"; return false; }
  auto res = util::run_command(tool_, {"list", "-H", "-o", "name"});
  if (!res.ok()) {
    error_ = "zpool list failed (exit " + std::to_string(res.exit_code) + ")";
    return false;
  }
  out = parse_name_list(res.output);
  return true;
}

bool ZpoolScrubCollector::status(const std::string& pool, int64_t now, model::ScrubFacts& out) {
  if (tool_.empty()) { error_ = "zpool command not found"; return false; }
  auto res = util::run_command(tool_, {"status", pool});
  if (!res.ok()) {
    error_ = "cannot get status of pool " + pool;
    return false;
  }
  out.pool = pool;
  out.state = parse_scan_status(res.output, now);
  return true;
}

} // namespace zfscheck::collectors
