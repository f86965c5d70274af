#pragma once

#include <string>

#include "dns/mx_lookup.hpp"
#include "domain/sanitization_types.hpp"

namespace service::validation {

struct ValidationContext {
  // Normalized address, shared by every stage.
  std::string email;
  // Empty unless the address holds exactly one '@'.
  std::string domain;
  dns::Deadline deadline;
};

struct ValidationResult {
  bool valid = true;
  domain::ReasonCode code = domain::ReasonCode::kNone;

  static ValidationResult success() { return {true, domain::ReasonCode::kNone}; }

  static ValidationResult failure(domain::ReasonCode code) {
    return {false, code};
  }

  // Valid, but with an informational reason for the caller.
  static ValidationResult caveat(domain::ReasonCode code) {
    return {true, code};
  }

  bool hasCaveat() const { return valid && code != domain::ReasonCode::kNone; }
};

} // namespace service::validation
