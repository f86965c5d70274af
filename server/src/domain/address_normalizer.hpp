#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace domain {

/**
 * @brief Trim surrounding whitespace and lowercase an address.
 */
std::string normalizeAddress(std::string_view raw);

/**
 * @brief Split pasted text on newline, comma and semicolon.
 * @return Normalized, non-empty candidates in first-seen order.
 */
std::vector<std::string> parseAddresses(std::string_view text);

/**
 * @brief Normalize a sequence of raw entries (e.g. CSV rows).
 *
 * Each entry is split on the same delimiters as parseAddresses(), so an entry
 * holding several addresses contributes all of them.
 */
std::vector<std::string>
normalizeAddresses(const std::vector<std::string> &entries);

} // namespace domain
