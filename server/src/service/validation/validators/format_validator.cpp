#include "service/validation/validators/format_validator.hpp"

#include <algorithm>

namespace service::validation {

namespace {

constexpr std::string_view kLocalPartSymbols = ".!#$%&'*+/=?^_`{|}~-";
constexpr std::size_t kMaxLabelLength = 63;

bool isAsciiAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9');
}

bool isLocalPartChar(char c) {
  return isAsciiAlnum(c) || kLocalPartSymbols.find(c) != std::string_view::npos;
}

// 1 to 63 characters, alphanumeric at both ends, hyphens only inside.
bool isValidLabel(std::string_view label) {
  if (label.empty() || label.size() > kMaxLabelLength) {
    return false;
  }
  if (!isAsciiAlnum(label.front()) || !isAsciiAlnum(label.back())) {
    return false;
  }
  return std::all_of(label.begin(), label.end(),
                     [](char c) { return isAsciiAlnum(c) || c == '-'; });
}

} // namespace

bool isValidFormat(std::string_view email) {
  const auto at = email.find('@');
  if (at == std::string_view::npos || at == 0) {
    return false;
  }

  const auto localPart = email.substr(0, at);
  if (!std::all_of(localPart.begin(), localPart.end(), isLocalPartChar)) {
    return false;
  }

  // A second '@' ends up inside a label and fails there.
  std::string_view domainPart = email.substr(at + 1);
  while (true) {
    const auto dot = domainPart.find('.');
    if (!isValidLabel(domainPart.substr(0, dot))) {
      return false;
    }
    if (dot == std::string_view::npos) {
      return true;
    }
    domainPart.remove_prefix(dot + 1);
  }
}

} // namespace service::validation
