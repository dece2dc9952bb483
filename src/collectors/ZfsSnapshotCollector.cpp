#include "collectors/ZfsSnapshotCollector.hpp"
#include "collectors/ZfsParsers.hpp"
#include "util/Command.hpp"
#include "util/Units.hpp"

namespace zfscheck::collectors {

ZfsSnapshotCollector::ZfsSnapshotCollector()
    : tool_(util::find_tool("zfs", "ZFSCHECK_ZFS_PATH")) {}

bool ZfsSnapshotCollector::list(const std::vector<std::string>& pools, std::vector<model::SnapshotRecord>& out) {
  if (tool_.empty()) { error_ = "zfs command not found"; return false; }
  std::vector<std::string> args{"list", "-H", "-p", "-t", "snapshot", "-o", "name,creation"};
  if (!pools.empty()) {
    args.emplace_back("-r");
    args.insert(args.end(), pools.begin(), pools.end());
  }
  auto res = util::run_command(tool_, args);
  if (!res.ok()) {
    error_ = "zfs list failed (exit " + std::to_string(res.exit_code) + ")";
    return false;
  }
  parse_snapshot_list(res.output, out);
  return true;
}

bool ZfsSnapshotCollector::used_bytes(const std::string& dataset, uint64_t& out) {
  if (tool_.empty()) { error_ = "zfs command not found"; return false; }
  auto res = util::run_command(tool_, {"list", "-H", "-o", "usedbysnapshots", dataset});
  if (!res.ok()) {
    error_ = "cannot read usedbysnapshots of " + dataset;
    return false;
  }
  auto bytes = util::parse_size(res.output);
  if (!bytes) {
    error_ = "unexpected usedbysnapshots value for " + dataset;
    return false;
  }
  out = *bytes;
  return true;
}

} // namespace zfscheck::collectors
