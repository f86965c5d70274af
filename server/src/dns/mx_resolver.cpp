#include "dns/mx_resolver.hpp"

namespace dns {

std::string_view toString(DnsErrorKind kind) {
  switch (kind) {
  case DnsErrorKind::kNotFound:
    return "not-found";
  case DnsErrorKind::kNoData:
    return "no-data";
  case DnsErrorKind::kTimeout:
    return "timeout";
  case DnsErrorKind::kServerFailure:
    return "server-failure";
  case DnsErrorKind::kRefused:
    return "refused";
  case DnsErrorKind::kOther:
    return "other";
  case DnsErrorKind::kResolverUnavailable:
    return "resolver-unavailable";
  }
  return "unknown";
}

} // namespace dns
