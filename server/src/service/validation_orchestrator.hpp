#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "concurrency/bounded_task_pool.hpp"
#include "dns/mx_lookup.hpp"
#include "dns/mx_resolver.hpp"
#include "dns/retry_policy.hpp"
#include "domain/disposable_domains.hpp"
#include "domain/sanitization_types.hpp"

namespace service {

/**
 * @brief Runs the sanitization pipeline over a batch of raw addresses.
 *
 * features:
 *  - Normalizes and deduplicates the input, then validates every unique
 *    address through Format -> Disposable -> MX, skipping disabled stages.
 *  - Validations run on a bounded worker pool; each domain is resolved once
 *    per batch.
 *  - The batch deadline always yields a complete report: addresses still in
 *    flight are settled with the pure stages and, when those pass, reported
 *    valid with the DNS-uncertain reason.
 *  - Only a systemic resolver failure aborts the batch.
 */
class ValidationOrchestrator {
public:
  struct Config {
    std::size_t maxConcurrency = 16;
    dns::RetryPolicy::Config retry;
    std::chrono::milliseconds batchTimeout{60000};
  };

  ValidationOrchestrator(
      std::shared_ptr<dns::IMxResolver> resolver,
      std::shared_ptr<const domain::DisposableDomainSet> disposableDomains);
  ValidationOrchestrator(
      std::shared_ptr<dns::IMxResolver> resolver,
      std::shared_ptr<const domain::DisposableDomainSet> disposableDomains,
      Config config, dns::Sleeper sleeper = {});
  ~ValidationOrchestrator();

  ValidationOrchestrator(const ValidationOrchestrator &) = delete;
  ValidationOrchestrator &operator=(const ValidationOrchestrator &) = delete;

  /**
   * @brief Sanitize a batch.
   * @param rawAddresses Raw entries; each may hold several delimited
   *        addresses.
   * @param deadline Batch deadline, the configured batch timeout when empty.
   * @return The report, or an error message on systemic DNS failure.
   */
  [[nodiscard]] std::expected<domain::SanitizationReport, std::string>
  sanitize(const std::vector<std::string> &rawAddresses,
           const domain::ValidationOptions &options,
           dns::Deadline deadline = std::nullopt);

  /**
   * @brief Validate one address synchronously on the calling thread.
   */
  [[nodiscard]] std::expected<domain::ValidationResult, std::string>
  validateAddress(std::string_view email,
                  const domain::ValidationOptions &options);

  const Config &config() const { return config_; }

private:
  struct Batch;

  std::shared_ptr<Batch> prepareBatch(std::vector<std::string> addresses,
                                      const domain::ValidationOptions &options,
                                      dns::Deadline deadline) const;

  std::shared_ptr<dns::IMxResolver> resolver_;
  std::shared_ptr<const domain::DisposableDomainSet> disposableDomains_;
  Config config_;
  dns::Sleeper sleeper_;
  std::unique_ptr<concurrency::BoundedTaskPool> pool_;
};

} // namespace service
