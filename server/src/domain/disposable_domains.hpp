#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace domain {

/**
 * @brief Domain part of an address, lowercased.
 * @return Empty string unless the address holds exactly one '@'.
 */
std::string extractDomain(std::string_view email);

/**
 * @brief Read-only set of disposable/temporary mail domains.
 *
 * Lookups are exact matches on the lowercased domain, no subdomain logic.
 * Instances are immutable once built and safe to share between threads.
 */
class DisposableDomainSet {
public:
  DisposableDomainSet() = default;
  explicit DisposableDomainSet(const std::vector<std::string> &domains);

  static std::shared_ptr<const DisposableDomainSet> builtin();

  /**
   * @brief Load one domain per line, ignoring blank lines and '#' comments.
   * @return The set, or an error message when the file cannot be read.
   */
  static std::expected<std::shared_ptr<const DisposableDomainSet>, std::string>
  loadFromFile(const std::string &path);

  bool containsDomain(std::string_view domain) const;

  // Fails closed: an address without a single '@' is never a match.
  bool isDisposableAddress(std::string_view email) const;

  std::size_t size() const { return domains_.size(); }

private:
  std::unordered_set<std::string> domains_;
};

} // namespace domain
