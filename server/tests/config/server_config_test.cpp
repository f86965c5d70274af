#include <gtest/gtest.h>

#include "config/server_config.hpp"

namespace config {
namespace {

using namespace std::chrono_literals;

TEST(ServerConfigTest, NoArguments_UsesDefaults) {
  const auto config = parseServerConfig({});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->serverAddress, "0.0.0.0:50051");
  EXPECT_EQ(config->dbPath, "sanitizer_db.db");
  EXPECT_EQ(config->maxConcurrency, 16u);
  EXPECT_EQ(config->batchTimeout, 60000ms);
  EXPECT_EQ(config->dnsAttemptTimeout, 5s);
  EXPECT_EQ(config->dnsRetries, 2);
  EXPECT_EQ(config->dnsBackoffStep, 300ms);
  EXPECT_FALSE(config->disposableDomainsFile.has_value());
  EXPECT_FALSE(config->showHelp);
}

TEST(ServerConfigTest, AllFlags_AreApplied) {
  const auto config = parseServerConfig(
      {"--address", "127.0.0.1:6000", "--db-path", "/tmp/runs.db",
       "--disposable-domains", "/etc/disposable.txt", "--max-concurrency", "4",
       "--batch-timeout-ms", "2500", "--dns-timeout-sec", "3", "--dns-retries",
       "0", "--dns-backoff-ms", "0"});

  ASSERT_TRUE(config.has_value()) << config.error();
  EXPECT_EQ(config->serverAddress, "127.0.0.1:6000");
  EXPECT_EQ(config->dbPath, "/tmp/runs.db");
  EXPECT_EQ(config->disposableDomainsFile, "/etc/disposable.txt");
  EXPECT_EQ(config->maxConcurrency, 4u);
  EXPECT_EQ(config->batchTimeout, 2500ms);
  EXPECT_EQ(config->dnsAttemptTimeout, 3s);
  EXPECT_EQ(config->dnsRetries, 0);
  EXPECT_EQ(config->dnsBackoffStep, 0ms);
}

TEST(ServerConfigTest, HelpFlag_SetsShowHelp) {
  EXPECT_TRUE(parseServerConfig({"-h"})->showHelp);
  EXPECT_TRUE(parseServerConfig({"--max-concurrency", "2", "--help"})->showHelp);
}

TEST(ServerConfigTest, MissingValue_IsReported) {
  const auto config = parseServerConfig({"--db-path"});

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), "Missing value for --db-path");
}

TEST(ServerConfigTest, UnknownOption_IsReported) {
  const auto config = parseServerConfig({"--verbose", "yes"});

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), "Unknown option --verbose");
}

TEST(ServerConfigTest, NonNumericValue_IsRejected) {
  const auto config = parseServerConfig({"--max-concurrency", "many"});

  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().find("Invalid value 'many' for --max-concurrency"),
            std::string::npos);
}

TEST(ServerConfigTest, TrailingGarbage_IsRejected) {
  EXPECT_FALSE(parseServerConfig({"--batch-timeout-ms", "100ms"}).has_value());
}

TEST(ServerConfigTest, ValuesBelowMinimum_AreRejected) {
  EXPECT_FALSE(parseServerConfig({"--max-concurrency", "0"}).has_value());
  EXPECT_FALSE(parseServerConfig({"--batch-timeout-ms", "0"}).has_value());
  EXPECT_FALSE(parseServerConfig({"--dns-timeout-sec", "0"}).has_value());
  EXPECT_FALSE(parseServerConfig({"--dns-retries", "-1"}).has_value());
  EXPECT_FALSE(parseServerConfig({"--dns-backoff-ms", "-5"}).has_value());
}

TEST(ServerConfigTest, Usage_NamesProgramAndFlags) {
  const auto text = usage("mail_sanitizer_server");

  EXPECT_NE(text.find("mail_sanitizer_server"), std::string::npos);
  EXPECT_NE(text.find("--max-concurrency"), std::string::npos);
  EXPECT_NE(text.find("--disposable-domains"), std::string::npos);
}

} // namespace
} // namespace config
