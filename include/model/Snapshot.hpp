#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace zfscheck::model {

// One line of the snapshot listing.
struct SnapshotRecord {
  std::string dataset;
  std::string snapshot;    // part after '@'
  int64_t creation{};
};

struct SnapshotEntry {
  std::string name;        // full "dataset@snap"
  int64_t creation{};      // epoch seconds
};

// Snapshots of one dataset, already restricted to the configured filter.
struct SnapshotFacts {
  std::string dataset;
  std::vector<SnapshotEntry> entries; // listing order
  uint64_t used_bytes{};
  std::string filter;                 // filter that produced entries ("" = none)

  [[nodiscard]] size_t count() const { return entries.size(); }

  // Newest/oldest by creation; on ties the last-listed entry wins.
  // Must not be called on an empty set.
  [[nodiscard]] const SnapshotEntry& newest() const {
    const SnapshotEntry* best = &entries.front();
    for (const auto& e : entries) if (e.creation >= best->creation) best = &e;
    return *best;
  }

  [[nodiscard]] const SnapshotEntry& oldest() const {
    const SnapshotEntry* best = &entries.front();
    for (const auto& e : entries) if (e.creation <= best->creation) best = &e;
    return *best;
  }
};

} // namespace zfscheck::model
