#include "service/validation_orchestrator.hpp"

#include <condition_variable>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>

#include "dns/mx_lookup_cache.hpp"
#include "domain/address_normalizer.hpp"
#include "domain/deduplicator.hpp"
#include "service/validation/address_validation_chain.hpp"
#include "service/validation/validators/disposable_domain_validator.hpp"
#include "service/validation/validators/format_validator.hpp"
#include "service/validation/validators/mx_record_validator.hpp"

namespace service {

struct ValidationOrchestrator::Batch {
  std::vector<std::string> addresses;
  domain::ValidationOptions options;
  dns::Deadline deadline;

  // Full pipeline, and the stages that never block (used after expiry).
  validation::AddressValidationChain chain;
  validation::AddressValidationChain pureChain;
  std::shared_ptr<validation::MxRecordValidator> mxValidator;

  std::mutex mutex;
  std::condition_variable doneCv;
  std::vector<std::optional<validation::ValidationResult>> results;
  std::size_t completed = 0;
  bool expired = false;

  validation::ValidationContext contextFor(std::size_t index) const {
    return {.email = addresses[index],
            .domain = domain::extractDomain(addresses[index]),
            .deadline = deadline};
  }
};

namespace {

domain::ValidationResult toDomainResult(std::string email,
                                        const validation::ValidationResult &r) {
  if (!r.valid) {
    return domain::ValidationResult::invalid(std::move(email), r.code);
  }
  if (r.hasCaveat()) {
    return domain::ValidationResult::validWithCaveat(std::move(email), r.code);
  }
  return domain::ValidationResult::valid(std::move(email));
}

} // namespace

ValidationOrchestrator::ValidationOrchestrator(
    std::shared_ptr<dns::IMxResolver> resolver,
    std::shared_ptr<const domain::DisposableDomainSet> disposableDomains)
    : ValidationOrchestrator(std::move(resolver), std::move(disposableDomains),
                             Config{}) {}

ValidationOrchestrator::ValidationOrchestrator(
    std::shared_ptr<dns::IMxResolver> resolver,
    std::shared_ptr<const domain::DisposableDomainSet> disposableDomains,
    Config config, dns::Sleeper sleeper)
    : resolver_(std::move(resolver)),
      disposableDomains_(std::move(disposableDomains)), config_(config),
      sleeper_(std::move(sleeper)),
      pool_(std::make_unique<concurrency::BoundedTaskPool>(
          config_.maxConcurrency)) {
  if (!disposableDomains_) {
    disposableDomains_ = domain::DisposableDomainSet::builtin();
  }
}

ValidationOrchestrator::~ValidationOrchestrator() = default;

std::shared_ptr<ValidationOrchestrator::Batch>
ValidationOrchestrator::prepareBatch(std::vector<std::string> addresses,
                                     const domain::ValidationOptions &options,
                                     dns::Deadline deadline) const {
  auto batch = std::make_shared<Batch>();
  batch->addresses = std::move(addresses);
  batch->options = options;
  batch->deadline = deadline;
  batch->results.resize(batch->addresses.size());

  if (options.checkFormat) {
    auto format = std::make_shared<validation::FormatValidator>();
    batch->chain.add(format);
    batch->pureChain.add(format);
  }

  if (options.checkDisposable) {
    auto disposable = std::make_shared<validation::DisposableDomainValidator>(
        disposableDomains_);
    batch->chain.add(disposable);
    batch->pureChain.add(disposable);
  }

  if (options.checkMx) {
    auto cache = std::make_shared<dns::MxLookupCache>(dns::MxLookup(
        resolver_, dns::RetryPolicy(config_.retry), sleeper_));
    batch->mxValidator =
        std::make_shared<validation::MxRecordValidator>(std::move(cache));
    batch->chain.add(batch->mxValidator);
  }

  return batch;
}

std::expected<domain::SanitizationReport, std::string>
ValidationOrchestrator::sanitize(const std::vector<std::string> &rawAddresses,
                                 const domain::ValidationOptions &options,
                                 dns::Deadline deadline) {
  auto normalized = domain::normalizeAddresses(rawAddresses);
  const std::size_t total = normalized.size();

  auto deduplicated =
      domain::deduplicate(std::move(normalized), options.removeDuplicates);

  domain::SanitizationReport report;
  report.stats.total = total;
  report.stats.duplicates = deduplicated.duplicates;

  if (deduplicated.addresses.empty()) {
    return report;
  }

  if (!deadline.has_value()) {
    deadline = std::chrono::steady_clock::now() + config_.batchTimeout;
  }

  auto batch =
      prepareBatch(std::move(deduplicated.addresses), options, deadline);
  const std::size_t count = batch->addresses.size();

  for (std::size_t i = 0; i < count; ++i) {
    const bool accepted = pool_->submit([batch, i] {
      {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (batch->expired) {
          return;
        }
      }

      const auto result = batch->chain.validate(batch->contextFor(i));

      {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (batch->expired) {
          return;
        }
        batch->results[i] = result;
        ++batch->completed;
      }
      batch->doneCv.notify_all();
    });

    if (!accepted) {
      return std::unexpected(std::string("Validation pool is shutting down"));
    }
  }

  std::vector<std::optional<validation::ValidationResult>> results;
  {
    std::unique_lock<std::mutex> lock(batch->mutex);
    const bool finished = batch->doneCv.wait_until(
        lock, *deadline, [&batch, count] { return batch->completed == count; });
    if (!finished) {
      batch->expired = true;
      std::cout << std::format("Sanitization deadline reached: {} of {} "
                               "addresses settled without DNS verification",
                               count - batch->completed, count)
                << std::endl;
    }
    results = batch->results;
  }

  if (batch->mxValidator) {
    if (const auto error = batch->mxValidator->systemicError()) {
      return std::unexpected(std::format("DNS resolution unavailable ({}): {}",
                                         dns::toString(error->kind),
                                         error->message));
    }
  }

  for (std::size_t i = 0; i < count; ++i) {
    validation::ValidationResult result;
    if (results[i].has_value()) {
      result = *results[i];
    } else {
      result = batch->pureChain.validate(batch->contextFor(i));
      if (result.valid && options.checkMx) {
        result = validation::ValidationResult::caveat(
            domain::ReasonCode::kDnsUncertain);
      }
    }

    auto entry = toDomainResult(batch->addresses[i], result);
    if (entry.isValid) {
      report.validEmails.push_back(entry.email);
      if (entry.hasCaveat()) {
        report.warnings.push_back(std::move(entry));
      }
    } else {
      report.invalidEmails.push_back(std::move(entry));
    }
  }

  report.stats.valid = report.validEmails.size();
  report.stats.invalid = report.invalidEmails.size();
  return report;
}

std::expected<domain::ValidationResult, std::string>
ValidationOrchestrator::validateAddress(
    std::string_view email, const domain::ValidationOptions &options) {
  auto normalized = domain::normalizeAddress(email);
  const auto deadline = std::chrono::steady_clock::now() + config_.batchTimeout;

  auto batch = prepareBatch({normalized}, options, deadline);
  const auto result = batch->chain.validate(batch->contextFor(0));

  if (batch->mxValidator) {
    if (const auto error = batch->mxValidator->systemicError()) {
      return std::unexpected(std::format("DNS resolution unavailable ({}): {}",
                                         dns::toString(error->kind),
                                         error->message));
    }
  }

  return toDomainResult(std::move(normalized), result);
}

} // namespace service
