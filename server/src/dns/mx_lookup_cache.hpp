#pragma once

#include <cstddef>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dns/mx_lookup.hpp"

namespace dns {

/**
 * @brief Resolves each domain at most once per batch.
 *
 * The first caller for a domain performs the lookup on its own thread; later
 * callers for the same domain block on that result instead of querying DNS
 * again.
 */
class MxLookupCache {
public:
  explicit MxLookupCache(MxLookup lookup) : lookup_(std::move(lookup)) {}

  MxLookupCache(const MxLookupCache &) = delete;
  MxLookupCache &operator=(const MxLookupCache &) = delete;

  MxLookupResult lookup(const std::string &domain,
                        Deadline deadline = std::nullopt);

  std::size_t size() const;

private:
  MxLookup lookup_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_future<MxLookupResult>> entries_;
};

} // namespace dns
