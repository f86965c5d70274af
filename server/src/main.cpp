#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

#include "config/server_config.hpp"
#include "database/database_manager_factory.hpp"
#include "dns/resolv_mx_resolver.hpp"
#include "domain/disposable_domains.hpp"
#include "grpc/grpc_runner.hpp"
#include "service/validation_orchestrator.hpp"

int main(int argc, char **argv) {
  const std::vector<std::string_view> args(argv + 1, argv + argc);
  const std::string_view programName =
      argc > 0 ? argv[0] : "mail_sanitizer_server";

  auto serverConfig = config::parseServerConfig(args);
  if (!serverConfig) {
    std::cerr << serverConfig.error() << std::endl;
    std::cerr << config::usage(programName);
    return 1;
  }

  if (serverConfig->showHelp) {
    std::cout << config::usage(programName);
    return 0;
  }

  auto disposableDomains = domain::DisposableDomainSet::builtin();
  if (serverConfig->disposableDomainsFile.has_value()) {
    auto loaded = domain::DisposableDomainSet::loadFromFile(
        *serverConfig->disposableDomainsFile);
    if (!loaded) {
      std::cerr << loaded.error() << std::endl;
      return 1;
    }
    disposableDomains = std::move(*loaded);
  }
  std::cout << "Disposable domain list: " << disposableDomains->size()
            << " entries" << std::endl;

  auto db =
      database::DatabaseManagerFactory::createDatabaseManager(serverConfig->dbPath);
  if (!db) {
    std::cerr << "Failed to initialize database: " << db.error() << std::endl;
    return 1;
  }

  if (auto error = (*db)->printStatisticsTableContent()) {
    std::cerr << "Failed to print statistics: " << *error << std::endl;
  }

  auto resolver = std::make_shared<dns::ResolvMxResolver>(
      dns::ResolvMxResolver::Config{.attemptTimeout =
                                        serverConfig->dnsAttemptTimeout});

  auto orchestrator = std::make_shared<service::ValidationOrchestrator>(
      resolver, disposableDomains,
      service::ValidationOrchestrator::Config{
          .maxConcurrency = serverConfig->maxConcurrency,
          .retry = {.maxRetries = serverConfig->dnsRetries,
                    .backoffStep = serverConfig->dnsBackoffStep},
          .batchTimeout = serverConfig->batchTimeout});

  try {
    GrpcRunner runner(*db, orchestrator, serverConfig->serverAddress);
    runner.wait();
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
