#include "dns/retry_policy.hpp"

#include <algorithm>

namespace dns {

RetryPolicy::RetryPolicy(Config config) : config_(config) {
  config_.maxRetries = std::max(config_.maxRetries, 0);
  config_.backoffStep =
      std::max(config_.backoffStep, std::chrono::milliseconds::zero());
}

RetryDecision RetryPolicy::classify(DnsErrorKind kind) const {
  switch (kind) {
  case DnsErrorKind::kNotFound:
  case DnsErrorKind::kNoData:
    return RetryDecision::kGiveUp;
  case DnsErrorKind::kResolverUnavailable:
    return RetryDecision::kAbort;
  case DnsErrorKind::kTimeout:
  case DnsErrorKind::kServerFailure:
  case DnsErrorKind::kRefused:
  case DnsErrorKind::kOther:
    break;
  }
  return RetryDecision::kRetry;
}

} // namespace dns
