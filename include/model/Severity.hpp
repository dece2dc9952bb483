#pragma once
#include <string_view>

namespace zfscheck::model {

// Check severity. OK < WARNING < CRITICAL is the aggregation order;
// UNKNOWN means "cannot determine" and is never compared against the others.
enum class Severity { Ok, Warning, Critical, Unknown };

// Integer written at the start of every output line (and used as exit code
// for process-level failures).
[[nodiscard]] constexpr int to_wire(Severity s) {
  switch (s) {
    case Severity::Ok:       return 0;
    case Severity::Warning:  return 1;
    case Severity::Critical: return 2;
    case Severity::Unknown:  return 3;
  }
  return 3;
}

[[nodiscard]] constexpr std::string_view to_string(Severity s) {
  switch (s) {
    case Severity::Ok:       return "OK";
    case Severity::Warning:  return "WARNING";
    case Severity::Critical: return "CRITICAL";
    case Severity::Unknown:  return "UNKNOWN";
  }
  return "UNKNOWN";
}

// Rank within OK/WARNING/CRITICAL. Unknown has no rank.
[[nodiscard]] constexpr int rank(Severity s) {
  switch (s) {
    case Severity::Ok:       return 0;
    case Severity::Warning:  return 1;
    case Severity::Critical: return 2;
    case Severity::Unknown:  return -1;
  }
  return -1;
}

// Larger of two evaluated severities. Both must be OK, WARNING or CRITICAL.
[[nodiscard]] constexpr Severity worse(Severity a, Severity b) {
  return rank(b) > rank(a) ? b : a;
}

} // namespace zfscheck::model
