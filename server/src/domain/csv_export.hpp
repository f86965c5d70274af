#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace domain {

inline constexpr std::string_view kCsvExportFilename = "sanitized-emails.csv";

/**
 * @brief Render addresses as a one-column CSV.
 *
 * Output is an "email" header line followed by one address per line; no
 * newline follows the last address.
 */
std::string generateCsv(const std::vector<std::string> &emails);

} // namespace domain
