#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dns/mx_resolver.hpp"
#include "dns/retry_policy.hpp"

namespace dns {

enum class MxStatus {
  kPresent,
  kAbsent,
  kUnknown, // every attempt failed transiently
};

enum class MxLookupState {
  kPending,
  kSuccess,
  kTransientFailure,
  kPermanentFailure,
  kExhausted,
};

struct MxLookupOutcome {
  MxStatus status = MxStatus::kUnknown;
  int attempts = 0;
  std::string detail;
};

// The error side only carries systemic resolver failures.
using MxLookupResult = std::expected<MxLookupOutcome, DnsError>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;
using Deadline = std::optional<std::chrono::steady_clock::time_point>;

/**
 * @brief Runs one MX lookup to completion under a RetryPolicy.
 *
 * States: Pending -> {Success, TransientFailure, PermanentFailure}.
 * TransientFailure returns to Pending after the policy's backoff while
 * attempts remain and the deadline allows the wait, otherwise the lookup ends
 * Exhausted and reports MxStatus::kUnknown. No query is started once the
 * deadline has passed; a query already in flight runs to its own timeout.
 */
class MxLookup {
public:
  MxLookup(std::shared_ptr<IMxResolver> resolver, RetryPolicy policy,
           Sleeper sleeper = {});

  MxLookupResult run(std::string_view domain,
                     Deadline deadline = std::nullopt) const;

  const RetryPolicy &policy() const { return policy_; }

private:
  MxQueryResult query(std::string_view domain) const;

  std::shared_ptr<IMxResolver> resolver_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

} // namespace dns
