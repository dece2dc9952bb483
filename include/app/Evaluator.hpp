#pragma once
#include "app/Thresholds.hpp"
#include "model/CheckResult.hpp"
#include "model/Scrub.hpp"
#include "model/Snapshot.hpp"
#include <cstdint>

namespace zfscheck::app {

// Scores one dataset's snapshots on three axes: newest age, oldest age
// (must lie inside [oldest_warn_days, oldest_crit_days]) and count.
// Pure: 'now' is the only notion of time.
[[nodiscard]] model::Evaluation evaluate_snapshots(const model::SnapshotFacts& facts,
                                                   const SnapshotThresholds& t,
                                                   int64_t now);

// Scores one pool's last or current scan.
[[nodiscard]] model::Evaluation evaluate_scrub(const model::ScrubFacts& facts,
                                               const ScrubThresholds& t);

} // namespace zfscheck::app
