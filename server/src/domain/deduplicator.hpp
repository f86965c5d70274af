#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace domain {

struct DeduplicationResult {
  std::vector<std::string> addresses;
  std::size_t duplicates = 0;
};

/**
 * @brief Collapse normalized addresses into an order-preserving unique set.
 *
 * The first occurrence wins. duplicates is computed against the normalized
 * input, so blank raw entries never count as duplicates. When
 * removeDuplicates is false the input is returned unchanged.
 */
DeduplicationResult deduplicate(std::vector<std::string> addresses,
                                bool removeDuplicates);

} // namespace domain
