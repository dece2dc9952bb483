#include "app/CheckRunner.hpp"
#include "app/Aggregator.hpp"
#include "app/EntityOrder.hpp"
#include "app/Evaluator.hpp"
#include "app/Filter.hpp"
#include "app/LineRenderer.hpp"
#include "util/Debug.hpp"

#include <cstdio>
#include <optional>
#include <regex>
#include <stdexcept>

namespace zfscheck::app {

static int fail_run(std::ostream& out, const std::string& label, const std::string& message) {
  std::fprintf(stderr, "zfscheck: CheckRunner: %s\n", message.c_str());
  out << render_failure(label, message) << '\n';
  return kExitUnknown;
}

static model::AggregateResult entity_failure(const std::string& label, const std::string& entity,
                                             const std::string& message) {
  std::fprintf(stderr, "zfscheck: CheckRunner: %s: %s\n", entity.c_str(), message.c_str());
  model::AggregateResult r;
  r.label = label;
  r.entity = entity;
  r.severity = model::Severity::Unknown;
  r.message = message;
  return r;
}

int run_snapshot_check(const SnapshotCheckConfig& cfg, collectors::ISnapshotSource& source,
                       int64_t now, std::ostream& out) {
  const auto& t = cfg.thresholds;

  std::optional<std::regex> ignore;
  std::optional<SnapshotFilter> filter;
  try {
    if (!t.ignore_pattern.empty()) ignore.emplace(t.ignore_pattern);
    filter.emplace(t.snapshot_filter);
  } catch (const std::regex_error& e) {
    return fail_run(out, cfg.label, std::string("invalid pattern: ") + e.what());
  }

  std::vector<model::SnapshotRecord> records;
  if (!source.list(cfg.pools, records))
    return fail_run(out, cfg.label, "cannot list snapshots: " + source.last_error());

  auto grouped = filter->apply(records);
  std::vector<std::string> names;
  names.reserve(grouped.size());
  for (const auto& [dataset, entries] : grouped) names.push_back(dataset);

  auto order = reorder(filter_entities(std::move(names), ignore), t.important);
  if (order.empty()) return fail_run(out, cfg.label, "no datasets with snapshots found");
  if (util::debug_enabled())
    std::fprintf(stderr, "zfscheck: CheckRunner: %zu snapshots, %zu datasets to check\n",
                 records.size(), order.size());

  for (const auto& dataset : order) {
    model::AggregateResult r;
    try {
      model::SnapshotFacts facts;
      facts.dataset = dataset;
      facts.filter = t.snapshot_filter;
      if (auto it = grouped.find(dataset); it != grouped.end()) facts.entries = it->second;
      if (facts.count() > 0 && !source.used_bytes(dataset, facts.used_bytes))
        throw std::runtime_error(source.last_error());
      r = aggregate(cfg.label, dataset, evaluate_snapshots(facts, t, now));
    } catch (const std::exception& e) {
      r = entity_failure(cfg.label, dataset, e.what());
    }
    out << render_line(r) << '\n';
  }
  return kExitOk;
}

int run_scrub_check(const ScrubCheckConfig& cfg, collectors::IScrubSource& source,
                    int64_t now, std::ostream& out) {
  std::vector<std::string> order;
  if (!cfg.pools.empty()) {
    order = reorder({}, cfg.pools);
  } else {
    std::vector<std::string> pools;
    if (!source.pools(pools))
      return fail_run(out, cfg.label, "cannot list pools: " + source.last_error());
    order = filter_entities(std::move(pools), std::nullopt);
  }
  if (order.empty()) return fail_run(out, cfg.label, "no pools found");

  for (const auto& pool : order) {
    model::AggregateResult r;
    try {
      model::ScrubFacts facts;
      if (!source.status(pool, now, facts)) throw std::runtime_error(source.last_error());
      r = aggregate(cfg.label, pool, evaluate_scrub(facts, cfg.thresholds));
    } catch (const std::exception& e) {
      r = entity_failure(cfg.label, pool, e.what());
    }
    out << render_line(r) << '\n';
  }
  return kExitOk;
}

} // namespace zfscheck::app
