#pragma once
#include "model/CheckResult.hpp"
#include <string>

namespace zfscheck::app {

// Folds an entity's sub-check results into one result.
// A precondition failure is UNKNOWN outright. Otherwise the severity is the
// worst sub-check; OK carries the consolidated summary, WARNING/CRITICAL the
// message of the first sub-check reaching that severity.
[[nodiscard]] model::AggregateResult aggregate(std::string label, std::string entity,
                                               const model::Evaluation& ev);

} // namespace zfscheck::app
