#pragma once
#include "app/Config.hpp"
#include "collectors/IScrubSource.hpp"
#include "collectors/ISnapshotSource.hpp"
#include <cstdint>
#include <ostream>

namespace zfscheck::app {

// Exit code of a completed run; per-entity severity travels in the lines.
inline constexpr int kExitOk = 0;
// Nothing to evaluate, or the run could not start. One diagnostic line only.
inline constexpr int kExitUnknown = 3;

// Evaluates every dataset (important ones first) and writes one line each.
// A failure on one dataset becomes that dataset's UNKNOWN line.
int run_snapshot_check(const SnapshotCheckConfig& cfg, collectors::ISnapshotSource& source,
                       int64_t now, std::ostream& out);

// Evaluates the scan state of every configured (or imported) pool.
int run_scrub_check(const ScrubCheckConfig& cfg, collectors::IScrubSource& source,
                    int64_t now, std::ostream& out);

} // namespace zfscheck::app
