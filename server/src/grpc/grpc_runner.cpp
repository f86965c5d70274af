#include "grpc/grpc_runner.hpp"

#include <iostream>
#include <stdexcept>

GrpcRunner::GrpcRunner(
    std::shared_ptr<database::IDatabaseManager> db,
    std::shared_ptr<service::ValidationOrchestrator> orchestrator,
    std::string_view serverAddress)
    : orchestrator_(std::move(orchestrator)),
      dbLogger_(std::make_shared<observers::DatabaseEventLogger>(db)) {
  // Register observers with the event dispatcher
  eventDispatcher_.registerObserver(dbLogger_);

  // Create SanitizerService with dependencies
  service_ = std::make_unique<SanitizerService>(orchestrator_,
                                                &eventDispatcher_);

  const std::string serverAddressString(serverAddress);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(serverAddressString,
                           grpc::InsecureServerCredentials());
  builder.RegisterService(service_.get());

  server_ = builder.BuildAndStart();
  if (!server_) {
    throw std::runtime_error("Failed to start gRPC server.");
  }

  std::cout << "Server listening on " << serverAddressString << std::endl;

  serverThread_ = std::jthread([this](const std::stop_token &) {
    if (server_) {
      server_->Wait();
    }
  });
}

GrpcRunner::~GrpcRunner() {
  if (server_) {
    server_->Shutdown();
  }
}

void GrpcRunner::wait() {
  if (serverThread_.joinable()) {
    serverThread_.join();
  }
}
