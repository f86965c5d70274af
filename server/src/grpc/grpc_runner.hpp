#pragma once

#include <memory>
#include <string_view>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "database/database_event_logger.hpp"
#include "database/database_manager.hpp"
#include "service/events/sanitizer_events_dispatcher.hpp"
#include "service/sanitizer_service.hpp"
#include "service/validation_orchestrator.hpp"

class GrpcRunner {
public:
  GrpcRunner(std::shared_ptr<database::IDatabaseManager> db,
             std::shared_ptr<service::ValidationOrchestrator> orchestrator,
             std::string_view serverAddress);
  ~GrpcRunner();

  void wait();

  GrpcRunner(const GrpcRunner &) = delete;
  GrpcRunner &operator=(const GrpcRunner &) = delete;
  GrpcRunner(GrpcRunner &&) = delete;
  GrpcRunner &operator=(GrpcRunner &&) = delete;

private:
  // Sanitization pipeline shared by every request
  std::shared_ptr<service::ValidationOrchestrator> orchestrator_;

  // Observers
  std::shared_ptr<observers::DatabaseEventLogger> dbLogger_;

  // Event dispatcher
  events::EventDispatcher eventDispatcher_;

  // gRPC components
  std::unique_ptr<SanitizerService> service_;
  std::unique_ptr<grpc::Server> server_;
  std::jthread serverThread_;
};
