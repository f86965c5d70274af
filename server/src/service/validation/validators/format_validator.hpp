#pragma once

#include <string_view>

#include "service/validation/address_validator.hpp"

namespace service::validation {

/**
 * @brief Syntactic shape check: local part, '@', then dot-separated DNS
 * labels of 1 to 63 alphanumeric characters with internal hyphens only.
 *
 * Says nothing about deliverability.
 */
bool isValidFormat(std::string_view email);

class FormatValidator : public IAddressValidator {
public:
  ValidationResult validate(const ValidationContext &ctx) override {
    if (!isValidFormat(ctx.email)) {
      return ValidationResult::failure(domain::ReasonCode::kInvalidFormat);
    }
    return ValidationResult::success();
  }
};

} // namespace service::validation
