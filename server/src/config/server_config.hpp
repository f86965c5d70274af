#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace config {

struct ServerConfig {
  std::string serverAddress = "0.0.0.0:50051";
  std::string dbPath = "sanitizer_db.db";
  std::size_t maxConcurrency = 16;
  std::chrono::milliseconds batchTimeout{60000};
  std::chrono::seconds dnsAttemptTimeout{5};
  int dnsRetries = 2;
  std::chrono::milliseconds dnsBackoffStep{300};
  // One domain per line; the built-in list is used when unset.
  std::optional<std::string> disposableDomainsFile;
  bool showHelp = false;
};

/**
 * @brief Build the server configuration from command-line flags.
 * @param args Arguments without the program name.
 * @return The configuration, or an error message naming the bad flag.
 */
std::expected<ServerConfig, std::string>
parseServerConfig(const std::vector<std::string_view> &args);

std::string usage(std::string_view programName);

} // namespace config
