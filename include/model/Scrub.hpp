#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace zfscheck::model {

// Scan in progress (scrub or resilver).
struct ScanRunning {
  bool resilver{false};
  double percent_done{};
  int64_t seconds_remaining{};   // 0 when zpool gives no estimate
  uint64_t repaired_bytes{};
  int64_t elapsed_seconds{};
};

// Last scan finished. The same payload serves scrubs and resilvers.
struct ScanCompleted {
  uint64_t repaired_bytes{};
  uint64_t error_count{};
  int64_t duration_seconds{};
  int64_t seconds_since_completion{};
};

struct ScrubCompleted : ScanCompleted {};
struct ResilverCompleted : ScanCompleted {};

// Pool has no scan history (or the last scan was canceled).
struct ScanNone {};

using ScanState = std::variant<ScanNone, ScanRunning, ScrubCompleted, ResilverCompleted>;

struct ScrubFacts {
  std::string pool;
  ScanState state{ScanNone{}};
};

} // namespace zfscheck::model
