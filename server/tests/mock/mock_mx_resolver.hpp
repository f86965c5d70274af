#pragma once

#include "dns/mx_resolver.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace mock {

// Scripted DNS: answers per domain, falling back to one MX record.
class MockMxResolver : public dns::IMxResolver {
public:
  std::function<dns::MxQueryResult(std::string_view)> resolveMxFn;

  // Simulated latency of every query
  std::chrono::milliseconds latency{0};

  dns::MxQueryResult resolveMx(std::string_view domain) override {
    const int inFlightNow = ++inFlight_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[std::string(domain)];
      if (inFlightNow > maxInFlight_) {
        maxInFlight_ = inFlightNow;
      }
    }

    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }

    dns::MxQueryResult result =
        resolveMxFn ? resolveMxFn(domain) : withMx(domain);
    --inFlight_;
    return result;
  }

  int callsFor(std::string_view domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = calls_.find(std::string(domain));
    return it == calls_.end() ? 0 : it->second;
  }

  int totalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto &entry : calls_) {
      total += entry.second;
    }
    return total;
  }

  int maxInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxInFlight_;
  }

  static dns::MxQueryResult withMx(std::string_view domain) {
    return std::vector<dns::MxRecord>{
        {.preference = 10, .exchange = "mx." + std::string(domain)}};
  }

  static dns::MxQueryResult failure(dns::DnsErrorKind kind) {
    return std::unexpected(dns::DnsError{kind, std::string(dns::toString(kind))});
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, int> calls_;
  std::atomic<int> inFlight_{0};
  int maxInFlight_ = 0;
};

} // namespace mock
