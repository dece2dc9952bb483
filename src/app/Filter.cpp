#include "app/Filter.hpp"

namespace zfscheck::app {

SnapshotFilter::SnapshotFilter(std::string pattern) : pattern_(std::move(pattern)) {
  if (!pattern_.empty() && pattern_.front() == '@') compiled_.emplace(pattern_);
}

bool SnapshotFilter::matches(const std::string& snapshot) const {
  if (pattern_.empty()) return true;
  if (compiled_) return std::regex_search("@" + snapshot, *compiled_);
  return snapshot.starts_with(pattern_);
}

std::map<std::string, std::vector<model::SnapshotEntry>>
SnapshotFilter::apply(const std::vector<model::SnapshotRecord>& records) const {
  std::map<std::string, std::vector<model::SnapshotEntry>> out;
  for (const auto& r : records) {
    if (!matches(r.snapshot)) continue;
    out[r.dataset].push_back(model::SnapshotEntry{r.dataset + "@" + r.snapshot, r.creation});
  }
  return out;
}

} // namespace zfscheck::app
