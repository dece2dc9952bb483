#include "app/EntityOrder.hpp"

#include <algorithm>
#include <unordered_set>

namespace zfscheck::app {

std::vector<std::string> filter_entities(std::vector<std::string> names, const std::optional<std::regex>& ignore) {
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  if (ignore) {
    std::erase_if(names, [&](const std::string& n){ return std::regex_search(n, *ignore); });
  }
  return names;
}

std::vector<std::string> reorder(const std::vector<std::string>& entities, const std::vector<std::string>& important) {
  std::vector<std::string> out;
  out.reserve(entities.size() + important.size());
  std::unordered_set<std::string> placed;
  for (const auto& name : important) {
    if (name.empty() || !placed.insert(name).second) continue;
    out.push_back(name);
  }
  for (const auto& name : entities) {
    if (placed.contains(name)) continue;
    out.push_back(name);
  }
  return out;
}

} // namespace zfscheck::app
