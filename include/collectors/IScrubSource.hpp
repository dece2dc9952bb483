#pragma once
#include "model/Scrub.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zfscheck::collectors {

class IScrubSource {
public:
  virtual ~IScrubSource() = default;

  // Names of all imported pools.
  [[nodiscard]] virtual bool pools(std::vector<std::string>& out) = 0;

  // Scan state of one pool; times are measured against 'now' (epoch seconds).
  [[nodiscard]] virtual bool status(const std::string& pool, int64_t now,
                                    zfscheck::model::ScrubFacts& out) = 0;

  [[nodiscard]] virtual const std::string& last_error() const = 0;
};

} // namespace zfscheck::collectors
