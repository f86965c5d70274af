#pragma once

#include <memory>
#include <optional>
#include <string>

#include "database/database_manager.hpp"

namespace SQLite {
class Database;
}

namespace database {

/**
 * @brief Manages database operations for the server.
 *
 * features:
 *  - Initializes and maintains a SQLite database connection.
 *  - Creates the SanitizationRuns and PeerStatistics tables on first use.
 *  - If needed, a database connection retry is implemented on each method call.
 */
class DatabaseManagerSQLite : public IDatabaseManager {
public:
  DatabaseManagerSQLite();
  explicit DatabaseManagerSQLite(std::string dbPath);
  ~DatabaseManagerSQLite() override;

  [[nodiscard]] OptionalErrorMessage init();
  [[nodiscard]] OptionalErrorMessage
  recordSanitizationRun(std::string_view peer,
                        const SanitizationRunRecord &record) noexcept override;
  [[nodiscard]] OptionalErrorMessage
  recordFailedRun(std::string_view peer,
                  std::string_view error) noexcept override;
  [[nodiscard]] OptionalErrorMessage
  incrementCsvExports(std::string_view peer) noexcept override;
  [[nodiscard]] OptionalErrorMessage
  printStatisticsTableContent() noexcept override;

private:
  [[nodiscard]] OptionalErrorMessage ensureOpen();
  [[nodiscard]] OptionalErrorMessage createTables();
  void upsertPeerStatistics(const std::string &peer, int runs, int failedRuns,
                            int csvExports, int64_t addresses);

  const std::string runsTable_ = "SanitizationRuns";
  const std::string statisticsTable_ = "PeerStatistics";
  std::string dbPath_;
  std::unique_ptr<SQLite::Database> db_;
};

} // namespace database
