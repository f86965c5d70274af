#pragma once

#include <memory>
#include <vector>

#include "service/validation/address_validator.hpp"

namespace service::validation {

class AddressValidationChain {
public:
  AddressValidationChain &add(std::shared_ptr<IAddressValidator> validator) {
    validators_.push_back(std::move(validator));
    return *this;
  }

  // Stops at the first failure. A caveat is kept unless a later stage fails.
  ValidationResult validate(const ValidationContext &ctx) const {
    ValidationResult outcome = ValidationResult::success();
    for (const auto &validator : validators_) {
      auto result = validator->validate(ctx);
      if (!result.valid) {
        return result;
      }
      if (result.hasCaveat()) {
        outcome = result;
      }
    }
    return outcome;
  }

  bool empty() const { return validators_.empty(); }

  std::size_t size() const { return validators_.size(); }

private:
  std::vector<std::shared_ptr<IAddressValidator>> validators_;
};

} // namespace service::validation
