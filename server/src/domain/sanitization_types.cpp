#include "domain/sanitization_types.hpp"

namespace domain {

std::string_view reasonText(ReasonCode code) {
  switch (code) {
  case ReasonCode::kInvalidFormat:
    return kInvalidFormatReason;
  case ReasonCode::kDisposableDomain:
    return kDisposableDomainReason;
  case ReasonCode::kNoMxRecords:
    return kNoMxRecordsReason;
  case ReasonCode::kDnsUncertain:
    return kDnsUncertainReason;
  case ReasonCode::kNone:
    break;
  }
  return {};
}

} // namespace domain
