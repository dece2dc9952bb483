#include "app/Aggregator.hpp"

using zfscheck::model::Severity;

namespace zfscheck::app {

model::AggregateResult aggregate(std::string label, std::string entity, const model::Evaluation& ev) {
  model::AggregateResult out;
  out.label = std::move(label);
  out.entity = std::move(entity);

  if (ev.failure) {
    out.severity = Severity::Unknown;
    out.message = *ev.failure;
    return out;
  }

  Severity overall = Severity::Ok;
  for (const auto& c : ev.checks) overall = model::worse(overall, c.severity);

  out.severity = overall;
  out.metrics = ev.metrics;
  if (overall == Severity::Ok) {
    out.message = ev.summary;
    return out;
  }
  for (const auto& c : ev.checks) {
    if (c.severity == overall) { out.message = c.message; break; }
  }
  return out;
}

} // namespace zfscheck::app
