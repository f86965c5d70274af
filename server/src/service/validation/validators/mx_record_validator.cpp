#include "service/validation/validators/mx_record_validator.hpp"

namespace service::validation {

ValidationResult MxRecordValidator::validate(const ValidationContext &ctx) {
  const auto result = cache_->lookup(ctx.domain, ctx.deadline);
  if (!result.has_value()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!systemicError_.has_value()) {
      systemicError_ = result.error();
    }
    return ValidationResult::caveat(domain::ReasonCode::kDnsUncertain);
  }

  switch (result->status) {
  case dns::MxStatus::kPresent:
    return ValidationResult::success();
  case dns::MxStatus::kAbsent:
    return ValidationResult::failure(domain::ReasonCode::kNoMxRecords);
  case dns::MxStatus::kUnknown:
    break;
  }
  return ValidationResult::caveat(domain::ReasonCode::kDnsUncertain);
}

std::optional<dns::DnsError> MxRecordValidator::systemicError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return systemicError_;
}

} // namespace service::validation
