#include "minitest.hpp"
#include "app/Aggregator.hpp"
#include "app/Evaluator.hpp"

#include <limits>

using zfscheck::model::Severity;

static constexpr int64_t kNow = 1700000000;
static constexpr int64_t kDay = 86400;

static zfscheck::model::SnapshotFacts facts_with(int64_t newest_age, int64_t oldest_age, size_t extra = 0) {
  zfscheck::model::SnapshotFacts f;
  f.dataset = "tank/data";
  f.entries.push_back({"tank/data@oldest", kNow - oldest_age});
  for (size_t i = 0; i < extra; ++i) f.entries.push_back({"tank/data@mid" + std::to_string(i), kNow - oldest_age + 1});
  f.entries.push_back({"tank/data@newest", kNow - newest_age});
  return f;
}

TEST(snapshot_single_fresh_snapshot_warns_on_oldest_axis) {
  zfscheck::model::SnapshotFacts f;
  f.dataset = "tank/data";
  f.entries.push_back({"tank/data@auto-1", kNow - 60});
  zfscheck::app::SnapshotThresholds t{};
  auto ev = zfscheck::app::evaluate_snapshots(f, t, kNow);
  ASSERT_TRUE(!ev.failure);
  ASSERT_EQ(ev.checks.size(), 3u);
  ASSERT_EQ(ev.checks[0].severity, Severity::Ok);
  ASSERT_EQ(ev.checks[1].severity, Severity::Warning);
  ASSERT_EQ(ev.checks[2].severity, Severity::Ok);
  auto r = zfscheck::app::aggregate("zfs_snapshot", f.dataset, ev);
  ASSERT_EQ(r.severity, Severity::Warning);
  ASSERT_CONTAINS(r.message, "oldest snapshot tank/data@auto-1");
  ASSERT_CONTAINS(r.message, "younger than 27 days");
}

TEST(snapshot_oldest_band_inversion) {
  zfscheck::app::SnapshotThresholds t{};
  t.oldest_warn_days = 27;
  t.oldest_crit_days = 180;
  auto young = zfscheck::app::evaluate_snapshots(facts_with(60, 10 * kDay), t, kNow);
  auto middle = zfscheck::app::evaluate_snapshots(facts_with(60, 100 * kDay), t, kNow);
  auto old = zfscheck::app::evaluate_snapshots(facts_with(60, 200 * kDay), t, kNow);
  ASSERT_EQ(young.checks[1].severity, Severity::Warning);
  ASSERT_EQ(middle.checks[1].severity, Severity::Ok);
  ASSERT_EQ(old.checks[1].severity, Severity::Critical);
  ASSERT_CONTAINS(old.checks[1].message, "older than 180 days");
}

TEST(snapshot_oldest_days_truncate) {
  zfscheck::app::SnapshotThresholds t{};
  // 26 days and 23 hours is still 26 days: below the 27 day floor
  auto ev = zfscheck::app::evaluate_snapshots(facts_with(60, 27 * kDay - 3600), t, kNow);
  ASSERT_EQ(ev.checks[1].severity, Severity::Warning);
  // exactly the crit day count is inside the band
  auto edge = zfscheck::app::evaluate_snapshots(facts_with(60, 180 * kDay + 3600), t, kNow);
  ASSERT_EQ(edge.checks[1].severity, Severity::Ok);
}

TEST(snapshot_newest_axis_levels) {
  zfscheck::app::SnapshotThresholds t{};
  auto ok = zfscheck::app::evaluate_snapshots(facts_with(90 * 60, 30 * kDay), t, kNow);
  auto warn = zfscheck::app::evaluate_snapshots(facts_with(90 * 60 + 1, 30 * kDay), t, kNow);
  auto crit = zfscheck::app::evaluate_snapshots(facts_with(180 * 60 + 1, 30 * kDay), t, kNow);
  ASSERT_EQ(ok.checks[0].severity, Severity::Ok);
  ASSERT_EQ(warn.checks[0].severity, Severity::Warning);
  ASSERT_EQ(crit.checks[0].severity, Severity::Critical);
  auto r = zfscheck::app::aggregate("zfs_snapshot", "tank/data", crit);
  ASSERT_EQ(r.severity, Severity::Critical);
  ASSERT_CONTAINS(r.message, "newest snapshot tank/data@newest is 180 min old");
}

TEST(snapshot_newest_crit_is_monotonic) {
  zfscheck::app::SnapshotThresholds t{};
  t.newest_warn_minutes = 1;
  auto f = facts_with(200 * 60, 30 * kDay);
  int last = 3;
  for (int64_t crit = 1; crit <= 400; crit += 7) {
    t.newest_crit_minutes = crit;
    auto ev = zfscheck::app::evaluate_snapshots(f, t, kNow);
    ASSERT_TRUE(!ev.failure);
    int r = zfscheck::model::rank(ev.checks[0].severity);
    ASSERT_TRUE(r <= last);
    last = r;
  }
  ASSERT_EQ(last, 1);
}

TEST(snapshot_count_axis) {
  zfscheck::app::SnapshotThresholds t{};
  t.count_warn = 3;
  t.count_crit = 5;
  auto three = zfscheck::app::evaluate_snapshots(facts_with(60, 30 * kDay, 1), t, kNow);
  auto four = zfscheck::app::evaluate_snapshots(facts_with(60, 30 * kDay, 2), t, kNow);
  auto six = zfscheck::app::evaluate_snapshots(facts_with(60, 30 * kDay, 4), t, kNow);
  ASSERT_EQ(three.checks[2].severity, Severity::Ok);
  ASSERT_EQ(four.checks[2].severity, Severity::Warning);
  ASSERT_EQ(six.checks[2].severity, Severity::Critical);
  ASSERT_CONTAINS(six.checks[2].message, "6 snapshots");
}

TEST(snapshot_warn_above_crit_is_unknown) {
  zfscheck::app::SnapshotThresholds bad_newest{};
  bad_newest.newest_warn_minutes = 200;
  zfscheck::app::SnapshotThresholds bad_oldest{};
  bad_oldest.oldest_warn_days = 365;
  zfscheck::app::SnapshotThresholds bad_count{};
  bad_count.count_crit = 10;
  zfscheck::model::SnapshotFacts empty;
  empty.dataset = "tank/empty";
  for (const auto& t : {bad_newest, bad_oldest, bad_count}) {
    for (const auto& f : {facts_with(60, 30 * kDay), empty}) {
      auto ev = zfscheck::app::evaluate_snapshots(f, t, kNow);
      ASSERT_TRUE(ev.failure.has_value());
      ASSERT_CONTAINS(*ev.failure, "warning must be smaller than critical");
      ASSERT_TRUE(ev.checks.empty());
      auto r = zfscheck::app::aggregate("zfs_snapshot", f.dataset, ev);
      ASSERT_EQ(r.severity, Severity::Unknown);
      ASSERT_TRUE(r.metrics.empty());
    }
  }
}

TEST(snapshot_no_snapshots_is_unknown) {
  zfscheck::model::SnapshotFacts f;
  f.dataset = "tank/new";
  zfscheck::app::SnapshotThresholds t{};
  t.count_warn = 0;
  t.count_crit = 0;
  auto ev = zfscheck::app::evaluate_snapshots(f, t, kNow);
  ASSERT_TRUE(ev.failure.has_value());
  ASSERT_EQ(*ev.failure, std::string("no snapshots found"));
  ASSERT_EQ(zfscheck::app::aggregate("l", f.dataset, ev).severity, Severity::Unknown);

  f.filter = "daily";
  auto filtered = zfscheck::app::evaluate_snapshots(f, t, kNow);
  ASSERT_EQ(*filtered.failure, std::string("no snapshots found with filter daily"));
}

TEST(snapshot_empty_dataset_name_is_unknown) {
  auto f = facts_with(60, 30 * kDay);
  f.dataset.clear();
  auto ev = zfscheck::app::evaluate_snapshots(f, {}, kNow);
  ASSERT_TRUE(ev.failure.has_value());
  ASSERT_EQ(*ev.failure, std::string("no dataset given"));
}

TEST(snapshot_ties_pick_last_listed) {
  zfscheck::model::SnapshotFacts f;
  f.dataset = "tank";
  f.entries.push_back({"tank@a", 100});
  f.entries.push_back({"tank@b", 200});
  f.entries.push_back({"tank@c", 100});
  f.entries.push_back({"tank@d", 200});
  ASSERT_EQ(f.newest().name, std::string("tank@d"));
  ASSERT_EQ(f.oldest().name, std::string("tank@c"));
}

TEST(snapshot_metrics_layout) {
  auto f = facts_with(600, 30 * kDay);
  f.used_bytes = 4096;
  auto ev = zfscheck::app::evaluate_snapshots(f, {}, kNow);
  ASSERT_EQ(ev.metrics.size(), 5u);
  ASSERT_EQ(ev.metrics[0].name, std::string("age"));
  ASSERT_EQ(ev.metrics[0].value, std::string("600"));
  ASSERT_EQ(ev.metrics[0].warn, std::string("5400"));
  ASSERT_EQ(ev.metrics[0].crit, std::string("10800"));
  ASSERT_EQ(ev.metrics[1].value, std::to_string(kNow - 600));
  ASSERT_EQ(ev.metrics[1].warn, std::to_string(kNow - 30 * kDay));
  ASSERT_EQ(ev.metrics[2].name, std::string("file_size"));
  ASSERT_EQ(ev.metrics[2].value, std::string("0"));
  ASSERT_EQ(ev.metrics[3].value, std::string("4096"));
  ASSERT_EQ(ev.metrics[4].value, std::string("2"));
  ASSERT_EQ(ev.metrics[4].warn, std::string("200"));
  ASSERT_EQ(ev.metrics[4].crit, std::string("500"));
}

TEST(snapshot_thresholds_out_of_range_are_unknown) {
  constexpr int64_t kHuge = std::numeric_limits<int64_t>::max() / 2;
  zfscheck::app::SnapshotThresholds huge_newest{};
  huge_newest.newest_warn_minutes = kHuge;
  huge_newest.newest_crit_minutes = kHuge;
  zfscheck::app::SnapshotThresholds huge_oldest{};
  huge_oldest.oldest_crit_days = kHuge;
  zfscheck::app::SnapshotThresholds negative{};
  negative.count_warn = -5;
  zfscheck::model::SnapshotFacts f;
  f.dataset = "tank";
  f.entries.push_back({"tank@a", kNow - 60});
  for (const auto& t : {huge_newest, huge_oldest, negative}) {
    auto r = zfscheck::app::aggregate("l", f.dataset, zfscheck::app::evaluate_snapshots(f, t, kNow));
    ASSERT_EQ(r.severity, Severity::Unknown);
    ASSERT_CONTAINS(r.message, "threshold out of range");
    ASSERT_TRUE(r.metrics.empty());
  }
}

TEST(snapshot_largest_convertible_threshold_is_accepted) {
  zfscheck::app::SnapshotThresholds t{};
  t.newest_warn_minutes = std::numeric_limits<int64_t>::max() / 60;
  t.newest_crit_minutes = std::numeric_limits<int64_t>::max() / 60;
  t.oldest_warn_days = 0;
  auto r = zfscheck::app::aggregate("l", "tank/data", zfscheck::app::evaluate_snapshots(facts_with(60, 30 * kDay), t, kNow));
  ASSERT_EQ(r.severity, Severity::Ok);
}
