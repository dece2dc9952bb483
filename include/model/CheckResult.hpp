#pragma once
#include "model/Severity.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zfscheck::model {

// One performance metric, rendered as name=value;warn;crit.
// Empty warn/crit fields are left out of the line.
struct Metric {
  std::string name;
  std::string value;
  std::string warn;
  std::string crit;
};

// Verdict of one evaluation axis (age, count, repaired, ...).
struct SubCheckResult {
  Severity severity{Severity::Ok};
  std::string axis;
  std::string message;
};

// Everything the evaluator derived for one entity.
// When failure is set the entity is UNKNOWN and checks is empty.
struct Evaluation {
  std::optional<std::string> failure;
  std::vector<SubCheckResult> checks;
  std::vector<Metric> metrics;
  std::string summary;            // consolidated text used when all axes are OK
};

struct AggregateResult {
  std::string label;
  std::string entity;
  Severity severity{Severity::Unknown};
  std::vector<Metric> metrics;
  std::string message;
};

} // namespace zfscheck::model
