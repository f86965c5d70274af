#include "service/sanitizer_service.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "domain/csv_export.hpp"

namespace {

domain::ValidationOptions
toValidationOptions(const sanitizer::SanitizeEmailsRequest &request) {
  domain::ValidationOptions options;
  if (!request.has_options()) {
    return options;
  }

  const auto &flags = request.options();
  if (flags.has_check_format()) {
    options.checkFormat = flags.check_format();
  }
  if (flags.has_check_disposable()) {
    options.checkDisposable = flags.check_disposable();
  }
  if (flags.has_check_mx()) {
    options.checkMx = flags.check_mx();
  }
  if (flags.has_remove_duplicates()) {
    options.removeDuplicates = flags.remove_duplicates();
  }
  return options;
}

sanitizer::ReasonCode toProtoReason(domain::ReasonCode code) {
  switch (code) {
  case domain::ReasonCode::kInvalidFormat:
    return sanitizer::REASON_INVALID_FORMAT;
  case domain::ReasonCode::kDisposableDomain:
    return sanitizer::REASON_DISPOSABLE_DOMAIN;
  case domain::ReasonCode::kNoMxRecords:
    return sanitizer::REASON_NO_MX_RECORDS;
  case domain::ReasonCode::kDnsUncertain:
    return sanitizer::REASON_DNS_UNCERTAIN;
  case domain::ReasonCode::kNone:
    break;
  }
  return sanitizer::REASON_NONE;
}

void fillResult(const domain::ValidationResult &result,
                sanitizer::EmailValidationResult *out) {
  out->set_email(result.email);
  out->set_is_valid(result.isValid);
  out->set_reason(result.reason.value_or(std::string{}));
  out->set_code(toProtoReason(result.code));
}

} // namespace

SanitizerService::SanitizerService(
    std::shared_ptr<service::ValidationOrchestrator> orchestrator,
    events::EventDispatcher *eventDispatcher)
    : orchestrator_(std::move(orchestrator)),
      eventDispatcher_(eventDispatcher) {}

SanitizerService::~SanitizerService() = default;

dns::Deadline SanitizerService::batchDeadline(
    std::uint32_t timeoutMs,
    std::chrono::system_clock::time_point callerDeadline) {
  const auto now = std::chrono::steady_clock::now();

  dns::Deadline deadline;
  if (timeoutMs > 0) {
    deadline = now + std::chrono::milliseconds(timeoutMs);
  }

  if (callerDeadline != std::chrono::system_clock::time_point::max()) {
    const auto remaining = std::chrono::duration_cast<
        std::chrono::steady_clock::duration>(
        callerDeadline - std::chrono::system_clock::now());
    const auto callerSteady = now + remaining;
    if (!deadline.has_value() || callerSteady < *deadline) {
      deadline = callerSteady;
    }
  }

  return deadline;
}

grpc::Status
SanitizerService::SanitizeEmails(grpc::ServerContext *context,
                                 const sanitizer::SanitizeEmailsRequest *request,
                                 sanitizer::SanitizeEmailsResponse *response) {
  if (request == nullptr || response == nullptr) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "request is required");
  }

  const std::string peer =
      (context != nullptr) ? context->peer() : std::string{};

  std::vector<std::string> entries(request->addresses().begin(),
                                   request->addresses().end());
  if (!request->raw_text().empty()) {
    entries.push_back(request->raw_text());
  }

  const dns::Deadline deadline = batchDeadline(
      request->timeout_ms(),
      (context != nullptr) ? context->deadline()
                           : std::chrono::system_clock::time_point::max());

  const auto start = std::chrono::steady_clock::now();
  auto report =
      orchestrator_->sanitize(entries, toValidationOptions(*request), deadline);
  const auto duration = std::chrono::steady_clock::now() - start;

  if (!report.has_value()) {
    std::cerr << std::format("[{}] Sanitization failed: {}", peer,
                             report.error())
              << std::endl;
    if (eventDispatcher_ != nullptr) {
      eventDispatcher_->notifySanitizationFailed(
          events::SanitizationFailedEvent{.peer = peer,
                                          .error = report.error()});
    }
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, report.error());
  }

  for (const auto &email : report->validEmails) {
    response->add_valid_emails(email);
  }
  for (const auto &result : report->invalidEmails) {
    fillResult(result, response->add_invalid_emails());
  }
  for (const auto &result : report->warnings) {
    fillResult(result, response->add_warnings());
  }

  auto *stats = response->mutable_stats();
  stats->set_total(static_cast<uint32_t>(report->stats.total));
  stats->set_valid(static_cast<uint32_t>(report->stats.valid));
  stats->set_invalid(static_cast<uint32_t>(report->stats.invalid));
  stats->set_duplicates(static_cast<uint32_t>(report->stats.duplicates));

  std::cout << std::format(
                   "[{}] Sanitized {} addresses: {} valid, {} invalid, "
                   "{} duplicates, {} unverified ({} ms)",
                   peer, report->stats.total, report->stats.valid,
                   report->stats.invalid, report->stats.duplicates,
                   report->warnings.size(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(
                       duration)
                       .count())
            << std::endl;

  if (eventDispatcher_ != nullptr) {
    eventDispatcher_->notifySanitizationCompleted(
        events::SanitizationCompletedEvent{.peer = peer,
                                           .stats = report->stats,
                                           .warnings = report->warnings.size(),
                                           .duration = duration});
  }

  return grpc::Status::OK;
}

grpc::Status
SanitizerService::ExportCsv(grpc::ServerContext *context,
                            const sanitizer::ExportCsvRequest *request,
                            sanitizer::ExportCsvResponse *response) {
  if (request == nullptr || response == nullptr) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "request is required");
  }

  const std::string peer =
      (context != nullptr) ? context->peer() : std::string{};

  const std::vector<std::string> emails(request->emails().begin(),
                                        request->emails().end());
  response->set_csv(domain::generateCsv(emails));
  response->set_filename(std::string(domain::kCsvExportFilename));

  if (eventDispatcher_ != nullptr) {
    eventDispatcher_->notifyCsvExported(
        events::CsvExportedEvent{.peer = peer, .rows = emails.size()});
  }

  return grpc::Status::OK;
}
