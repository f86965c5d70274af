#pragma once

#include <memory>

#include "domain/disposable_domains.hpp"
#include "service/validation/address_validator.hpp"

namespace service::validation {

class DisposableDomainValidator : public IAddressValidator {
public:
  explicit DisposableDomainValidator(
      std::shared_ptr<const domain::DisposableDomainSet> domains)
      : domains_(std::move(domains)) {}

  ValidationResult validate(const ValidationContext &ctx) override {
    if (domains_ && domains_->containsDomain(ctx.domain)) {
      return ValidationResult::failure(domain::ReasonCode::kDisposableDomain);
    }
    return ValidationResult::success();
  }

private:
  std::shared_ptr<const domain::DisposableDomainSet> domains_;
};

} // namespace service::validation
