#include "dns/mx_lookup_cache.hpp"

#include <exception>

namespace dns {

MxLookupResult MxLookupCache::lookup(const std::string &domain,
                                     Deadline deadline) {
  std::promise<MxLookupResult> promise;
  std::shared_future<MxLookupResult> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(domain);
    if (it != entries_.end()) {
      pending = it->second;
    } else {
      entries_.emplace(domain, promise.get_future().share());
    }
  }

  if (pending.valid()) {
    return pending.get();
  }

  try {
    auto result = lookup_.run(domain, deadline);
    promise.set_value(result);
    return result;
  } catch (...) {
    promise.set_exception(std::current_exception());
    throw;
  }
}

std::size_t MxLookupCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace dns
