#pragma once
#include "collectors/ISnapshotSource.hpp"

namespace zfscheck::collectors {

// Reads snapshots through the zfs command (ZFSCHECK_ZFS_PATH overrides the lookup).
class ZfsSnapshotCollector : public ISnapshotSource {
public:
  ZfsSnapshotCollector();

  [[nodiscard]] bool list(const std::vector<std::string>& pools,
                          std::vector<zfscheck::model::SnapshotRecord>& out) override;
  [[nodiscard]] bool used_bytes(const std::string& dataset, uint64_t& out) override;
  [[nodiscard]] const std::string& last_error() const override { return error_; }

private:
  std::string tool_;
  std::string error_;
};

} // namespace zfscheck::collectors
