#include "domain/address_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace domain {

namespace {

constexpr std::string_view kDelimiters = "\n,;";

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void appendCandidates(std::string_view text, std::vector<std::string> &out) {
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find_first_of(kDelimiters, start);
    const auto piece = text.substr(
        start, end == std::string_view::npos ? std::string_view::npos
                                             : end - start);

    auto normalized = normalizeAddress(piece);
    if (!normalized.empty()) {
      out.push_back(std::move(normalized));
    }

    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
}

} // namespace

std::string normalizeAddress(std::string_view raw) {
  const auto first = std::find_if_not(raw.begin(), raw.end(), isSpace);
  const auto last = std::find_if_not(raw.rbegin(), raw.rend(), isSpace).base();
  if (first >= last) {
    return {};
  }

  std::string normalized(first, last);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return normalized;
}

std::vector<std::string> parseAddresses(std::string_view text) {
  std::vector<std::string> addresses;
  appendCandidates(text, addresses);
  return addresses;
}

std::vector<std::string>
normalizeAddresses(const std::vector<std::string> &entries) {
  std::vector<std::string> addresses;
  addresses.reserve(entries.size());
  for (const auto &entry : entries) {
    appendCandidates(entry, addresses);
  }
  return addresses;
}

} // namespace domain
