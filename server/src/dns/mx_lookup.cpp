#include "dns/mx_lookup.hpp"

#include <exception>
#include <format>
#include <thread>
#include <utility>

namespace dns {

MxLookup::MxLookup(std::shared_ptr<IMxResolver> resolver, RetryPolicy policy,
                   Sleeper sleeper)
    : resolver_(std::move(resolver)), policy_(policy),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

MxQueryResult MxLookup::query(std::string_view domain) const {
  if (!resolver_) {
    return std::unexpected(DnsError{DnsErrorKind::kResolverUnavailable,
                                    "No DNS resolver configured"});
  }

  try {
    return resolver_->resolveMx(domain);
  } catch (const std::exception &ex) {
    return std::unexpected(DnsError{
        DnsErrorKind::kOther,
        std::format("{}: resolver error: {}", domain, ex.what())});
  }
}

MxLookupResult MxLookup::run(std::string_view domain,
                             Deadline deadline) const {
  if (domain.empty()) {
    return MxLookupOutcome{.status = MxStatus::kAbsent,
                           .attempts = 0,
                           .detail = "address has no domain"};
  }

  MxLookupState state = MxLookupState::kPending;
  int attempts = 0;
  bool hasRecords = false;
  DnsError lastError;

  while (true) {
    switch (state) {
    case MxLookupState::kPending: {
      if (deadline.has_value() &&
          std::chrono::steady_clock::now() >= *deadline) {
        if (attempts == 0) {
          lastError = DnsError{
              DnsErrorKind::kTimeout,
              std::format("{}: deadline passed before the lookup", domain)};
        }
        state = MxLookupState::kExhausted;
        break;
      }

      ++attempts;
      auto result = query(domain);
      if (result.has_value()) {
        hasRecords = !result->empty();
        state = MxLookupState::kSuccess;
        break;
      }

      lastError = std::move(result.error());
      switch (policy_.classify(lastError.kind)) {
      case RetryDecision::kGiveUp:
        state = MxLookupState::kPermanentFailure;
        break;
      case RetryDecision::kAbort:
        return std::unexpected(std::move(lastError));
      case RetryDecision::kRetry:
        state = MxLookupState::kTransientFailure;
        break;
      }
      break;
    }

    case MxLookupState::kTransientFailure: {
      if (!policy_.canRetry(attempts)) {
        state = MxLookupState::kExhausted;
        break;
      }

      const auto delay = policy_.delayBeforeRetry(attempts);
      if (deadline.has_value() &&
          std::chrono::steady_clock::now() + delay >= *deadline) {
        state = MxLookupState::kExhausted;
        break;
      }

      sleeper_(delay);
      state = MxLookupState::kPending;
      break;
    }

    case MxLookupState::kSuccess:
      return MxLookupOutcome{
          .status = hasRecords ? MxStatus::kPresent : MxStatus::kAbsent,
          .attempts = attempts,
          .detail = hasRecords ? std::string{} : "empty MX answer"};

    case MxLookupState::kPermanentFailure:
      return MxLookupOutcome{.status = MxStatus::kAbsent,
                             .attempts = attempts,
                             .detail = std::move(lastError.message)};

    case MxLookupState::kExhausted:
      return MxLookupOutcome{.status = MxStatus::kUnknown,
                             .attempts = attempts,
                             .detail = std::move(lastError.message)};
    }
  }
}

} // namespace dns
