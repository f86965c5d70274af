#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "dns/mx_lookup_cache.hpp"
#include "service/validation/address_validator.hpp"

namespace service::validation {

/**
 * @brief Maps the MX lookup outcome onto the address result.
 *
 * kPresent passes, kAbsent fails with kNoMxRecords and kUnknown passes with
 * the kDnsUncertain caveat. A systemic resolver failure is recorded in
 * systemicError() and the address is reported with the caveat so the batch
 * can finish; the orchestrator aborts the report when it is set.
 */
class MxRecordValidator : public IAddressValidator {
public:
  explicit MxRecordValidator(std::shared_ptr<dns::MxLookupCache> cache)
      : cache_(std::move(cache)) {}

  ValidationResult validate(const ValidationContext &ctx) override;

  std::optional<dns::DnsError> systemicError() const;

private:
  std::shared_ptr<dns::MxLookupCache> cache_;
  mutable std::mutex mutex_;
  std::optional<dns::DnsError> systemicError_;
};

} // namespace service::validation
