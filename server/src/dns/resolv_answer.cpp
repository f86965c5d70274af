#include "dns/resolv_answer.hpp"

#include <arpa/nameser.h>
#include <netdb.h>
#include <resolv.h>

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace dns {

DnsError classifyQueryFailure(int herrno, std::string_view domain) {
  switch (herrno) {
  case HOST_NOT_FOUND:
    return {DnsErrorKind::kNotFound,
            std::format("{}: no such domain", domain)};
  case NO_DATA:
    return {DnsErrorKind::kNoData,
            std::format("{}: no MX data for this domain", domain)};
  case TRY_AGAIN:
    return {DnsErrorKind::kTimeout,
            std::format("{}: query timed out or server busy", domain)};
  case NO_RECOVERY:
    return {DnsErrorKind::kServerFailure,
            std::format("{}: non-recoverable server failure", domain)};
  default:
    return {DnsErrorKind::kOther,
            std::format("{}: query failed (h_errno {})", domain, herrno)};
  }
}

MxQueryResult parseMxAnswer(const unsigned char *answer, int length,
                            std::string_view domain) {
  ns_msg handle;
  if (answer == nullptr || ns_initparse(answer, length, &handle) < 0) {
    return std::unexpected(DnsError{
        DnsErrorKind::kOther,
        std::format("{}: malformed DNS response", domain)});
  }

  switch (ns_msg_getflag(handle, ns_f_rcode)) {
  case ns_r_noerror:
    break;
  case ns_r_nxdomain:
    return std::unexpected(DnsError{
        DnsErrorKind::kNotFound, std::format("{}: no such domain", domain)});
  case ns_r_refused:
    return std::unexpected(DnsError{
        DnsErrorKind::kRefused, std::format("{}: query refused", domain)});
  default:
    return std::unexpected(DnsError{
        DnsErrorKind::kServerFailure,
        std::format("{}: server failure", domain)});
  }

  std::vector<MxRecord> records;
  const int count = ns_msg_count(handle, ns_s_an);
  for (int i = 0; i < count; ++i) {
    ns_rr rr;
    if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
      continue;
    }
    // Preference (2 bytes) plus at least the root label.
    if (ns_rr_type(rr) != ns_t_mx || ns_rr_rdlen(rr) < 3) {
      continue;
    }

    const unsigned char *rdata = ns_rr_rdata(rr);
    std::array<char, NS_MAXDNAME> name{};
    if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + 2,
                  name.data(), static_cast<int>(name.size())) < 0) {
      continue;
    }

    records.push_back(MxRecord{.preference =
                                   static_cast<std::uint16_t>(ns_get16(rdata)),
                               .exchange = std::string(name.data())});
  }

  if (records.empty()) {
    return std::unexpected(DnsError{
        DnsErrorKind::kNoData,
        std::format("{}: no MX data for this domain", domain)});
  }

  return records;
}

} // namespace dns
