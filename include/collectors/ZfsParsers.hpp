// Parsers for zfs/zpool text output
#pragma once
#include "model/Scrub.hpp"
#include "model/Snapshot.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zfscheck::collectors {

// Lines of `zfs list -H -p -t snapshot -o name,creation`.
// Malformed lines are skipped; returns the number of records appended.
size_t parse_snapshot_list(std::string_view text, std::vector<zfscheck::model::SnapshotRecord>& out);

// One name per line (`zpool list -H -o name`).
std::vector<std::string> parse_name_list(std::string_view text);

// Timestamp as printed by zpool status ("Sun Oct 13 00:29:13 2024"), local time.
std::optional<int64_t> parse_zpool_time(std::string_view text);

// The "scan:" section of `zpool status <pool>`.
zfscheck::model::ScanState parse_scan_status(std::string_view text, int64_t now);

} // namespace zfscheck::collectors
