#pragma once

#include <string_view>

#include "dns/mx_resolver.hpp"

namespace dns {

/**
 * @brief Map the resolver's h_errno after a failed res_nquery.
 *
 * HOST_NOT_FOUND and NO_DATA are authoritative answers; TRY_AGAIN and
 * NO_RECOVERY are transient. Anything else is kOther.
 */
DnsError classifyQueryFailure(int herrno, std::string_view domain);

/**
 * @brief Parse a raw DNS response to an MX query.
 *
 * A non-NOERROR rcode becomes the matching error kind. Answer records that
 * are not MX or are too short to hold a preference and a name are skipped;
 * a NOERROR response left without MX records is kNoData.
 */
MxQueryResult parseMxAnswer(const unsigned char *answer, int length,
                            std::string_view domain);

} // namespace dns
