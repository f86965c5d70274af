#include "domain/csv_export.hpp"

namespace domain {

std::string generateCsv(const std::vector<std::string> &emails) {
  std::string csv = "email\n";

  std::size_t size = csv.size();
  for (const auto &email : emails) {
    size += email.size() + 1;
  }
  csv.reserve(size);

  for (std::size_t i = 0; i < emails.size(); ++i) {
    if (i != 0) {
      csv += '\n';
    }
    csv += emails[i];
  }

  return csv;
}

} // namespace domain
