#pragma once
#include <regex>
#include <optional>
#include <string>
#include <vector>

namespace zfscheck::app {

// Sorted, deduplicated names with every name matching 'ignore' removed.
[[nodiscard]] std::vector<std::string> filter_entities(std::vector<std::string> names,
                                                       const std::optional<std::regex>& ignore);

// Important names first in configured order (injected when absent so they are
// still reported), then the remaining entities in their existing order.
[[nodiscard]] std::vector<std::string> reorder(const std::vector<std::string>& entities,
                                               const std::vector<std::string>& important);

} // namespace zfscheck::app
