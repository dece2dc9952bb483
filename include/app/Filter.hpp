#pragma once
#include "model/Snapshot.hpp"
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace zfscheck::app {

// Snapshot name filter. A pattern starting with '@' is a regex searched in
// "@<snapshot>"; anything else is a literal prefix of the snapshot name.
// An empty pattern keeps every snapshot.
class SnapshotFilter {
public:
  // Throws std::regex_error for an invalid '@' pattern.
  explicit SnapshotFilter(std::string pattern);

  [[nodiscard]] bool matches(const std::string& snapshot) const;

  // Matching snapshots grouped by dataset, listing order preserved.
  // Datasets without a single match are absent.
  [[nodiscard]] std::map<std::string, std::vector<zfscheck::model::SnapshotEntry>>
  apply(const std::vector<zfscheck::model::SnapshotRecord>& records) const;

private:
  std::string pattern_;
  std::optional<std::regex> compiled_;
};

} // namespace zfscheck::app
