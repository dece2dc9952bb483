#include "app/Thresholds.hpp"

#include <limits>

namespace zfscheck::app {

static constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

// 'unit' is the number of seconds per threshold unit; the converted limit
// must still fit an int64_t.
static std::optional<std::string> check_range(const char* what, int64_t value, int64_t unit) {
  if (value >= 0 && value <= kMax / unit) return std::nullopt;
  return std::string("threshold out of range (") + what + ": " + std::to_string(value) + ")";
}

static std::optional<std::string> check_pair(const char* what, int64_t warn, int64_t crit, int64_t unit) {
  if (auto e = check_range(what, warn, unit)) return e;
  if (auto e = check_range(what, crit, unit)) return e;
  if (warn <= crit) return std::nullopt;
  return std::string("warning must be smaller than critical (") + what + ": "
       + std::to_string(warn) + " > " + std::to_string(crit) + ")";
}

std::optional<std::string> validate(const SnapshotThresholds& t) {
  if (auto e = check_pair("newest minutes", t.newest_warn_minutes, t.newest_crit_minutes, 60)) return e;
  if (auto e = check_pair("oldest days", t.oldest_warn_days, t.oldest_crit_days, 86400)) return e;
  return check_pair("count", t.count_warn, t.count_crit, 1);
}

std::optional<std::string> validate(const ScrubThresholds& t) {
  if (auto e = check_pair("runtime seconds", t.runtime_warn_seconds, t.runtime_crit_seconds, 1)) return e;
  return check_pair("last run days", t.last_run_warn_days, t.last_run_crit_days, 86400);
}

} // namespace zfscheck::app
