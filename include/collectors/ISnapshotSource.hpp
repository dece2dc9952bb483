#pragma once
#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace zfscheck::collectors {

// Supplies snapshot facts so the check can run against zfs or a test double.
class ISnapshotSource {
public:
  virtual ~ISnapshotSource() = default;

  // All snapshots below the given pools (every pool when empty).
  // Return false if the listing could not be obtained.
  [[nodiscard]] virtual bool list(const std::vector<std::string>& pools,
                                  std::vector<zfscheck::model::SnapshotRecord>& out) = 0;

  // Space consumed by the dataset's snapshots, in bytes.
  [[nodiscard]] virtual bool used_bytes(const std::string& dataset, uint64_t& out) = 0;

  // Reason for the last false return.
  [[nodiscard]] virtual const std::string& last_error() const = 0;
};

} // namespace zfscheck::collectors
