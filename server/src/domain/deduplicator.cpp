#include "domain/deduplicator.hpp"

#include <string_view>
#include <unordered_set>

namespace domain {

DeduplicationResult deduplicate(std::vector<std::string> addresses,
                                bool removeDuplicates) {
  if (!removeDuplicates) {
    return {.addresses = std::move(addresses), .duplicates = 0};
  }

  const std::size_t originalCount = addresses.size();

  std::vector<std::string> unique;
  unique.reserve(originalCount);
  std::unordered_set<std::string> seen;
  seen.reserve(originalCount);

  for (auto &address : addresses) {
    if (seen.insert(address).second) {
      unique.push_back(std::move(address));
    }
  }

  const std::size_t duplicates = originalCount - unique.size();
  return {.addresses = std::move(unique), .duplicates = duplicates};
}

} // namespace domain
