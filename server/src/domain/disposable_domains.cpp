#include "domain/disposable_domains.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "domain/address_normalizer.hpp"

namespace domain {

namespace {

const std::vector<std::string> &builtinDomains() {
  static const std::vector<std::string> domains{
      "10minutemail.com",
      "guerrillamail.com",
      "temp-mail.org",
      "tempmail.com",
      "throwaway.email",
      "mailinator.com",
      "maildrop.cc",
      "yopmail.com",
      "getnada.com",
      "trashmail.com",
      "guerrillamailblock.com",
      "sharklasers.com",
      "guerrillamail.net",
      "guerrillamail.biz",
      "spam4.me",
      "grr.la",
      "guerrillamail.de",
      "trbvm.com",
      "tmails.net",
      "mohmal.com",
      "emailondeck.com",
      "fakeinbox.com",
      "mintemail.com",
      "dispostable.com",
      "throwam.com",
      "mt2015.com",
      "mt2014.com",
      "mailcatch.com",
      "mailnesia.com",
      "tempinbox.com",
      "getairmail.com",
      "mytemp.email",
      "anonbox.net",
      "mvrht.net",
      "mailtemporaire.fr",
      "correotemporal.org",
      "rootfest.net",
      "disposableemailaddresses.com",
      "33mail.com",
      "tempr.email",
      "fakemail.net",
      "gettempmail.com",
  };
  return domains;
}

} // namespace

std::string extractDomain(std::string_view email) {
  const auto at = email.find('@');
  if (at == std::string_view::npos ||
      email.find('@', at + 1) != std::string_view::npos) {
    return {};
  }

  std::string domain(email.substr(at + 1));
  std::transform(domain.begin(), domain.end(), domain.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return domain;
}

DisposableDomainSet::DisposableDomainSet(
    const std::vector<std::string> &domains) {
  domains_.reserve(domains.size());
  for (const auto &entry : domains) {
    auto domain = normalizeAddress(entry);
    if (!domain.empty()) {
      domains_.insert(std::move(domain));
    }
  }
}

std::shared_ptr<const DisposableDomainSet> DisposableDomainSet::builtin() {
  static const auto instance =
      std::make_shared<const DisposableDomainSet>(builtinDomains());
  return instance;
}

std::expected<std::shared_ptr<const DisposableDomainSet>, std::string>
DisposableDomainSet::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::unexpected("Failed to open disposable domain list: " + path);
  }

  std::vector<std::string> domains;
  std::string line;
  while (std::getline(file, line)) {
    const auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    domains.push_back(line);
  }

  if (file.bad()) {
    return std::unexpected("Failed to read disposable domain list: " + path);
  }

  return std::make_shared<const DisposableDomainSet>(domains);
}

bool DisposableDomainSet::containsDomain(std::string_view domain) const {
  if (domain.empty()) {
    return false;
  }
  return domains_.find(std::string(domain)) != domains_.end();
}

bool DisposableDomainSet::isDisposableAddress(std::string_view email) const {
  return containsDomain(extractDomain(email));
}

} // namespace domain
