#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

struct ValidationOptions {
  bool checkFormat = true;
  bool checkDisposable = true;
  bool checkMx = true;
  bool removeDuplicates = true;
};

enum class ReasonCode {
  kNone,
  kInvalidFormat,
  kDisposableDomain,
  kNoMxRecords,
  kDnsUncertain,
};

inline constexpr std::string_view kInvalidFormatReason = "Invalid email format";
inline constexpr std::string_view kDisposableDomainReason =
    "Disposable/temporary email domain";
inline constexpr std::string_view kNoMxRecordsReason =
    "Domain has no valid MX records";
inline constexpr std::string_view kDnsUncertainReason =
    "MX records could not be verified (network issue)";

std::string_view reasonText(ReasonCode code);

/**
 * @brief Outcome for one normalized address.
 *
 * reason is set whenever isValid is false, and also for valid addresses whose
 * MX check could not be completed (ReasonCode::kDnsUncertain).
 */
struct ValidationResult {
  std::string email;
  bool isValid = true;
  std::optional<std::string> reason;
  ReasonCode code = ReasonCode::kNone;

  static ValidationResult valid(std::string email) {
    return {std::move(email), true, std::nullopt, ReasonCode::kNone};
  }

  static ValidationResult invalid(std::string email, ReasonCode code) {
    return {std::move(email), false, std::string(reasonText(code)), code};
  }

  static ValidationResult validWithCaveat(std::string email, ReasonCode code) {
    return {std::move(email), true, std::string(reasonText(code)), code};
  }

  bool hasCaveat() const { return isValid && reason.has_value(); }
};

struct SanitizationStats {
  std::size_t total = 0;
  std::size_t valid = 0;
  std::size_t invalid = 0;
  std::size_t duplicates = 0;
};

struct SanitizationReport {
  std::vector<std::string> validEmails;
  std::vector<ValidationResult> invalidEmails;
  // Valid addresses carrying an informational reason, also in validEmails.
  std::vector<ValidationResult> warnings;
  SanitizationStats stats;
};

} // namespace domain
