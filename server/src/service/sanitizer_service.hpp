#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "sanitizer.grpc.pb.h"
#include "service/events/sanitizer_events_dispatcher.hpp"
#include "service/validation_orchestrator.hpp"

class SanitizerService final : public sanitizer::EmailSanitizer::Service {
public:
  SanitizerService(std::shared_ptr<service::ValidationOrchestrator> orchestrator,
                   events::EventDispatcher *eventDispatcher);
  ~SanitizerService() override;

  grpc::Status SanitizeEmails(grpc::ServerContext *context,
                              const sanitizer::SanitizeEmailsRequest *request,
                              sanitizer::SanitizeEmailsResponse *response) override;

  grpc::Status ExportCsv(grpc::ServerContext *context,
                         const sanitizer::ExportCsvRequest *request,
                         sanitizer::ExportCsvResponse *response) override;

  // Earliest of timeoutMs (0 = unset) and the caller's gRPC deadline
  // (time_point::max() = unset). Empty when neither is set.
  static dns::Deadline
  batchDeadline(std::uint32_t timeoutMs,
                std::chrono::system_clock::time_point callerDeadline);

private:
  std::shared_ptr<service::ValidationOrchestrator> orchestrator_;
  events::EventDispatcher *eventDispatcher_;
};
