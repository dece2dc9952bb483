#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zfscheck::app {

struct SnapshotThresholds {
  int64_t newest_warn_minutes = 90;
  int64_t newest_crit_minutes = 180;
  int64_t oldest_warn_days    = 27;   // oldest snapshot younger than this: warn
  int64_t oldest_crit_days    = 180;  // oldest snapshot older than this: crit
  int64_t count_warn          = 200;
  int64_t count_crit          = 500;
  std::string snapshot_filter;        // literal prefix, or regex when it starts with '@'
  std::string ignore_pattern;         // regex over dataset names
  std::vector<std::string> important; // always evaluated, listed first
};

struct ScrubThresholds {
  int64_t runtime_warn_seconds = 43200;
  int64_t runtime_crit_seconds = 86400;
  int64_t last_run_warn_days   = 60;
  int64_t last_run_crit_days   = 90;
};

// Returns a message for the first (warn, crit) pair that is negative, whose
// conversion to seconds would overflow, or that has warn > crit.
[[nodiscard]] std::optional<std::string> validate(const SnapshotThresholds& t);
[[nodiscard]] std::optional<std::string> validate(const ScrubThresholds& t);

} // namespace zfscheck::app
