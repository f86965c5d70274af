#pragma once

#include <chrono>

#include "dns/mx_resolver.hpp"

namespace dns {

/**
 * @brief IMxResolver backed by the system stub resolver (libresolv).
 *
 * features:
 *  - One res_state per call, so lookups from worker threads do not share
 *    resolver state.
 *  - The attempt timeout bounds a single query; retries are left to the
 *    caller.
 */
class ResolvMxResolver : public IMxResolver {
public:
  struct Config {
    std::chrono::seconds attemptTimeout{5};
  };

  ResolvMxResolver() = default;
  explicit ResolvMxResolver(Config config) : config_(config) {}

  MxQueryResult resolveMx(std::string_view domain) override;

private:
  Config config_;
};

} // namespace dns
