#include "dns/resolv_mx_resolver.hpp"

#include "dns/resolv_answer.hpp"

#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>

#include <array>
#include <cstring>
#include <string>

namespace dns {

namespace {

class ResolverState {
public:
  ResolverState() { std::memset(&state_, 0, sizeof(state_)); }
  ~ResolverState() {
    if (initialized_) {
      res_nclose(&state_);
    }
  }

  ResolverState(const ResolverState &) = delete;
  ResolverState &operator=(const ResolverState &) = delete;

  bool init() {
    initialized_ = res_ninit(&state_) == 0;
    return initialized_;
  }

  res_state get() { return &state_; }

private:
  struct __res_state state_;
  bool initialized_ = false;
};

} // namespace

MxQueryResult ResolvMxResolver::resolveMx(std::string_view domain) {
  ResolverState state;
  if (!state.init()) {
    return std::unexpected(DnsError{
        DnsErrorKind::kResolverUnavailable,
        "Failed to initialise the system resolver (res_ninit)"});
  }

  res_state statp = state.get();
  statp->retrans = static_cast<int>(config_.attemptTimeout.count());
  statp->retry = 1;

  const std::string name(domain);
  std::array<unsigned char, NS_MAXMSG> answer{};
  const int length = res_nquery(statp, name.c_str(), ns_c_in, ns_t_mx,
                                answer.data(), static_cast<int>(answer.size()));
  if (length < 0) {
    return std::unexpected(classifyQueryFailure(statp->res_h_errno, domain));
  }

  return parseMxAnswer(answer.data(), length, domain);
}

} // namespace dns
