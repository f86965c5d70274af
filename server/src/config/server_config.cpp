#include "config/server_config.hpp"

#include <charconv>
#include <format>

namespace config {

namespace {

template <typename T>
std::expected<T, std::string> parseNumber(std::string_view flag,
                                          std::string_view value, T minimum) {
  T parsed{};
  const auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::unexpected(
        std::format("Invalid value '{}' for {}: expected a number", value,
                    flag));
  }
  if (parsed < minimum) {
    return std::unexpected(std::format(
        "Invalid value '{}' for {}: must be at least {}", value, flag,
        minimum));
  }
  return parsed;
}

} // namespace

std::expected<ServerConfig, std::string>
parseServerConfig(const std::vector<std::string_view> &args) {
  ServerConfig config;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view flag = args[i];

    if (flag == "--help" || flag == "-h") {
      config.showHelp = true;
      continue;
    }

    if (i + 1 >= args.size()) {
      return std::unexpected(std::format("Missing value for {}", flag));
    }
    const std::string_view value = args[++i];

    if (flag == "--address") {
      config.serverAddress = std::string(value);
    } else if (flag == "--db-path") {
      config.dbPath = std::string(value);
    } else if (flag == "--disposable-domains") {
      config.disposableDomainsFile = std::string(value);
    } else if (flag == "--max-concurrency") {
      auto parsed = parseNumber<std::size_t>(flag, value, 1);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.maxConcurrency = *parsed;
    } else if (flag == "--batch-timeout-ms") {
      auto parsed = parseNumber<long long>(flag, value, 1);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.batchTimeout = std::chrono::milliseconds(*parsed);
    } else if (flag == "--dns-timeout-sec") {
      auto parsed = parseNumber<long long>(flag, value, 1);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.dnsAttemptTimeout = std::chrono::seconds(*parsed);
    } else if (flag == "--dns-retries") {
      auto parsed = parseNumber<int>(flag, value, 0);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.dnsRetries = *parsed;
    } else if (flag == "--dns-backoff-ms") {
      auto parsed = parseNumber<long long>(flag, value, 0);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      config.dnsBackoffStep = std::chrono::milliseconds(*parsed);
    } else {
      return std::unexpected(std::format("Unknown option {}", flag));
    }
  }

  return config;
}

std::string usage(std::string_view programName) {
  return std::format(
      "Usage: {} [options]\n"
      "  --address <host:port>         listening address (default "
      "0.0.0.0:50051)\n"
      "  --db-path <file>              SQLite run history (default "
      "sanitizer_db.db)\n"
      "  --max-concurrency <n>         validations in flight (default 16)\n"
      "  --batch-timeout-ms <ms>       default batch deadline (default 60000)\n"
      "  --dns-timeout-sec <s>         timeout of one MX query (default 5)\n"
      "  --dns-retries <n>             retries after a transient DNS failure "
      "(default 2)\n"
      "  --dns-backoff-ms <ms>         linear backoff step (default 300)\n"
      "  --disposable-domains <file>   replace the built-in disposable list\n"
      "  -h, --help                    show this help\n",
      programName);
}

} // namespace config
