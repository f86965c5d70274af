#pragma once

#include <chrono>

#include "dns/mx_resolver.hpp"

namespace dns {

enum class RetryDecision {
  kRetry,   // transient condition, try again if attempts remain
  kGiveUp,  // authoritative negative answer, retrying cannot help
  kAbort,   // the resolver itself is unusable
};

/**
 * @brief Bounded retry with linear backoff for MX lookups.
 *
 * With the defaults a lookup makes at most three attempts, waiting 300ms
 * after the first failure and 600ms after the second.
 */
class RetryPolicy {
public:
  struct Config {
    int maxRetries = 2;
    std::chrono::milliseconds backoffStep{300};
  };

  RetryPolicy() = default;
  explicit RetryPolicy(Config config);

  RetryDecision classify(DnsErrorKind kind) const;

  int maxAttempts() const { return config_.maxRetries + 1; }

  // attemptsMade counts attempts already performed, starting at 1.
  bool canRetry(int attemptsMade) const {
    return attemptsMade < maxAttempts();
  }

  std::chrono::milliseconds delayBeforeRetry(int attemptsMade) const {
    return config_.backoffStep * attemptsMade;
  }

  const Config &config() const { return config_; }

private:
  Config config_;
};

} // namespace dns
