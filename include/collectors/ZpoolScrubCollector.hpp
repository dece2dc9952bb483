#pragma once
#include "collectors/IScrubSource.hpp"

namespace zfscheck::collectors {

// Reads scan state through `zpool status` (ZFSCHECK_ZPOOL_PATH overrides the lookup).
class ZpoolScrubCollector : public IScrubSource {
public:
  ZpoolScrubCollector();

  [[nodiscard]] bool pools(std::vector<std::string>& out) override;
  [[nodiscard]] bool status(const std::string& pool, int64_t now,
                            zfscheck::model::ScrubFacts& out) override;
  [[nodiscard]] const std::string& last_error() const override { return error_; }

private:
  std::string tool_;
  std::string error_;
};

} // namespace zfscheck::collectors
