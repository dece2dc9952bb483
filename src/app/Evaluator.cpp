#include "app/Evaluator.hpp"
#include "util/Units.hpp"

#include <cstdio>

using zfscheck::model::Metric;
using zfscheck::model::Severity;
using zfscheck::model::SubCheckResult;

namespace zfscheck::app {

static constexpr int64_t kSecondsPerDay = 86400;

static Metric metric(std::string name, int64_t value) {
  return Metric{std::move(name), std::to_string(value), {}, {}};
}

static Metric metric(std::string name, int64_t value, int64_t warn, int64_t crit) {
  return Metric{std::move(name), std::to_string(value), std::to_string(warn), std::to_string(crit)};
}

static Metric metric_pct(std::string name, double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return Metric{std::move(name), buf, {}, {}};
}

// ---------------------------------------------------------------- snapshots

static SubCheckResult newest_axis(const model::SnapshotEntry& newest, const SnapshotThresholds& t, int64_t now) {
  int64_t diff = now - newest.creation;
  int64_t minutes = diff / 60;
  if (diff > t.newest_crit_minutes * 60)
    return {Severity::Critical, "newest", "newest snapshot " + newest.name + " is " + std::to_string(minutes)
                                          + " min old (crit " + std::to_string(t.newest_crit_minutes) + " min)"};
  if (diff > t.newest_warn_minutes * 60)
    return {Severity::Warning, "newest", "newest snapshot " + newest.name + " is " + std::to_string(minutes)
                                         + " min old (warn " + std::to_string(t.newest_warn_minutes) + " min)"};
  return {Severity::Ok, "newest", {}};
}

static SubCheckResult oldest_axis(const model::SnapshotEntry& oldest, const SnapshotThresholds& t, int64_t now) {
  int64_t days = (now - oldest.creation) / kSecondsPerDay;
  if (days > t.oldest_crit_days)
    return {Severity::Critical, "oldest", "oldest snapshot " + oldest.name + " is " + std::to_string(days)
                                          + " days old, older than " + std::to_string(t.oldest_crit_days) + " days"};
  if (days < t.oldest_warn_days)
    return {Severity::Warning, "oldest", "oldest snapshot " + oldest.name + " is " + std::to_string(days)
                                         + " days old, younger than " + std::to_string(t.oldest_warn_days) + " days"};
  return {Severity::Ok, "oldest", {}};
}

static SubCheckResult count_axis(int64_t count, const SnapshotThresholds& t) {
  if (count > t.count_crit)
    return {Severity::Critical, "count", std::to_string(count) + " snapshots, more than " + std::to_string(t.count_crit)};
  if (count > t.count_warn)
    return {Severity::Warning, "count", std::to_string(count) + " snapshots, more than " + std::to_string(t.count_warn)};
  return {Severity::Ok, "count", {}};
}

model::Evaluation evaluate_snapshots(const model::SnapshotFacts& facts, const SnapshotThresholds& t, int64_t now) {
  model::Evaluation ev;
  if (facts.dataset.empty()) { ev.failure = "no dataset given"; return ev; }
  if (auto err = validate(t)) { ev.failure = *err; return ev; }
  if (facts.count() == 0) {
    ev.failure = facts.filter.empty() ? std::string("no snapshots found")
                                      : "no snapshots found with filter " + facts.filter;
    return ev;
  }

  const auto& newest = facts.newest();
  const auto& oldest = facts.oldest();
  const auto count = static_cast<int64_t>(facts.count());
  int64_t age = now - newest.creation;

  ev.checks.push_back(newest_axis(newest, t, now));
  ev.checks.push_back(oldest_axis(oldest, t, now));
  ev.checks.push_back(count_axis(count, t));

  ev.metrics.push_back(metric("age", age, t.newest_warn_minutes * 60, t.newest_crit_minutes * 60));
  ev.metrics.push_back(Metric{"creation", std::to_string(newest.creation), std::to_string(oldest.creation), {}});
  ev.metrics.push_back(metric("file_size", 0));
  ev.metrics.push_back(Metric{"used", std::to_string(facts.used_bytes), {}, {}});
  ev.metrics.push_back(metric("count", count, t.count_warn, t.count_crit));

  ev.summary = "newest " + std::to_string(age / 60) + " min (" + newest.name + "), oldest "
             + std::to_string((now - oldest.creation) / kSecondsPerDay) + " days (" + oldest.name
             + "), count " + std::to_string(count) + ", used " + util::human_bytes(facts.used_bytes);
  return ev;
}

// ---------------------------------------------------------------- scrub

static void evaluate_running(const model::ScanRunning& r, const ScrubThresholds& t, model::Evaluation& ev) {
  const char* kind = r.resilver ? "resilver" : "scrub";
  SubCheckResult runtime{Severity::Ok, "runtime", {}};
  // Critical first: a run past both limits must surface as CRITICAL.
  if (r.elapsed_seconds > t.runtime_crit_seconds) {
    runtime = {Severity::Critical, "runtime", std::string(kind) + " running for " + util::format_duration(r.elapsed_seconds)
                                              + ", longer than " + util::format_duration(t.runtime_crit_seconds)};
  } else if (r.elapsed_seconds > t.runtime_warn_seconds) {
    runtime = {Severity::Warning, "runtime", std::string(kind) + " running for " + util::format_duration(r.elapsed_seconds)
                                             + ", longer than " + util::format_duration(t.runtime_warn_seconds)};
  }
  ev.checks.push_back(std::move(runtime));

  ev.metrics.push_back(metric("time", r.elapsed_seconds, t.runtime_warn_seconds, t.runtime_crit_seconds));
  ev.metrics.push_back(metric("errors", 0));
  ev.metrics.push_back(metric_pct("percent", r.percent_done));
  ev.metrics.push_back(metric("time_left", r.seconds_remaining));
  ev.metrics.push_back(Metric{"repaired", std::to_string(r.repaired_bytes), {}, {}});

  char pct[32];
  std::snprintf(pct, sizeof(pct), "%.2f%%", r.percent_done);
  ev.summary = std::string(kind) + " in progress, " + pct + " done, running for "
             + util::format_duration(r.elapsed_seconds) + ", "
             + (r.seconds_remaining > 0 ? util::format_duration(r.seconds_remaining) + " to go"
                                        : std::string("no completion estimate"))
             + ", " + util::human_bytes(r.repaired_bytes) + " repaired";
}

static void evaluate_completed(const model::ScanCompleted& c, bool resilver, const ScrubThresholds& t,
                               model::Evaluation& ev) {
  const std::string kind = resilver ? "resilver" : "scrub";
  int64_t days = c.seconds_since_completion / kSecondsPerDay;

  // Axes in increasing severity; aggregation keeps the maximum.
  SubCheckResult last_run{Severity::Ok, "last_run", {}};
  if (days > t.last_run_crit_days) {
    last_run = {Severity::Critical, "last_run", "last " + kind + " finished " + std::to_string(days)
                                                + " days ago, more than " + std::to_string(t.last_run_crit_days) + " days"};
  } else if (days > t.last_run_warn_days) {
    last_run = {Severity::Warning, "last_run", "last " + kind + " finished " + std::to_string(days)
                                               + " days ago, more than " + std::to_string(t.last_run_warn_days) + " days"};
  }
  ev.checks.push_back(std::move(last_run));

  if (c.repaired_bytes != 0)
    ev.checks.push_back({Severity::Warning, "repaired", "last " + kind + " repaired " + util::human_bytes(c.repaired_bytes)});
  else
    ev.checks.push_back({Severity::Ok, "repaired", {}});

  if (c.error_count > 0)
    ev.checks.push_back({Severity::Critical, "errors", "last " + kind + " finished with "
                                                       + std::to_string(c.error_count) + " errors"});
  else
    ev.checks.push_back({Severity::Ok, "errors", {}});

  ev.metrics.push_back(metric("last_run", c.seconds_since_completion,
                              t.last_run_warn_days * kSecondsPerDay, t.last_run_crit_days * kSecondsPerDay));
  ev.metrics.push_back(metric("runtime", c.duration_seconds));
  ev.metrics.push_back(Metric{"errors", std::to_string(c.error_count), {}, {}});
  ev.metrics.push_back(Metric{"repaired", std::to_string(c.repaired_bytes), {}, {}});

  ev.summary = "last " + kind + " finished " + std::to_string(days) + " days ago, took "
             + util::format_duration(c.duration_seconds) + ", repaired " + util::human_bytes(c.repaired_bytes)
             + ", " + std::to_string(c.error_count) + " errors";
}

model::Evaluation evaluate_scrub(const model::ScrubFacts& facts, const ScrubThresholds& t) {
  model::Evaluation ev;
  if (facts.pool.empty()) { ev.failure = "no pool given"; return ev; }
  if (auto err = validate(t)) { ev.failure = *err; return ev; }

  if (const auto* r = std::get_if<model::ScanRunning>(&facts.state)) {
    evaluate_running(*r, t, ev);
  } else if (const auto* s = std::get_if<model::ScrubCompleted>(&facts.state)) {
    evaluate_completed(*s, false, t, ev);
  } else if (const auto* rs = std::get_if<model::ResilverCompleted>(&facts.state)) {
    evaluate_completed(*rs, true, t, ev);
  } else {
    ev.checks.push_back({Severity::Warning, "scan", "no scrubbing information."});
  }
  return ev;
}

} // namespace zfscheck::app
