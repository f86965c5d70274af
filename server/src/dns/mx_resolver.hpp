#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace dns {

enum class DnsErrorKind {
  kNotFound,  // NXDOMAIN
  kNoData,    // the name exists but has no MX data
  kTimeout,
  kServerFailure,
  kRefused,
  kOther,
  // The resolver itself is unusable (e.g. no configuration), not per lookup.
  kResolverUnavailable,
};

std::string_view toString(DnsErrorKind kind);

struct DnsError {
  DnsErrorKind kind = DnsErrorKind::kOther;
  std::string message;
};

struct MxRecord {
  std::uint16_t preference = 0;
  std::string exchange;
};

using MxQueryResult = std::expected<std::vector<MxRecord>, DnsError>;

/**
 * @brief DNS capability consumed by the sanitization pipeline.
 *
 * Implementations perform a single MX query per call, without retrying, and
 * must be callable from several threads at once.
 */
class IMxResolver {
public:
  virtual ~IMxResolver() = default;

  virtual MxQueryResult resolveMx(std::string_view domain) = 0;
};

} // namespace dns
