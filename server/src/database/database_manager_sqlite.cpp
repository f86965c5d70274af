#include "database/database_manager_sqlite.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

#include <iomanip>
#include <iostream>
#include <utility>

namespace database {

DatabaseManagerSQLite::DatabaseManagerSQLite()
    : DatabaseManagerSQLite("sanitizer_db.db") {}

DatabaseManagerSQLite::DatabaseManagerSQLite(std::string dbPath)
    : dbPath_(std::move(dbPath)) {}

DatabaseManagerSQLite::~DatabaseManagerSQLite() = default;

OptionalErrorMessage DatabaseManagerSQLite::init() {
  if (db_) {
    return std::nullopt;
  }

  try {
    db_ = std::make_unique<SQLite::Database>(dbPath_, SQLite::OPEN_READWRITE |
                                                          SQLite::OPEN_CREATE);
  } catch (const std::exception &ex) {
    db_.reset();
    return std::string("Failed to open database: ") + ex.what();
  }

  if (auto error = createTables()) {
    db_.reset();
    return error;
  }

  return std::nullopt;
}

OptionalErrorMessage DatabaseManagerSQLite::createTables() {
  try {
    db_->exec("CREATE TABLE IF NOT EXISTS " + runsTable_ +
              " (id INTEGER PRIMARY KEY AUTOINCREMENT, "
              "peer TEXT NOT NULL, "
              "succeeded INTEGER NOT NULL, "
              "total INTEGER NOT NULL DEFAULT 0, "
              "valid INTEGER NOT NULL DEFAULT 0, "
              "invalid INTEGER NOT NULL DEFAULT 0, "
              "duplicates INTEGER NOT NULL DEFAULT 0, "
              "warnings INTEGER NOT NULL DEFAULT 0, "
              "duration_ms INTEGER NOT NULL DEFAULT 0, "
              "error TEXT, "
              "created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP);");

    db_->exec("CREATE TABLE IF NOT EXISTS " + statisticsTable_ +
              " (peer TEXT PRIMARY KEY, "
              "nb_of_runs INTEGER NOT NULL DEFAULT 0, "
              "nb_of_failed_runs INTEGER NOT NULL DEFAULT 0, "
              "nb_of_csv_exports INTEGER NOT NULL DEFAULT 0, "
              "addresses_processed INTEGER NOT NULL DEFAULT 0);");
  } catch (const std::exception &ex) {
    return std::string("Failed to create tables: ") + ex.what();
  }

  return std::nullopt;
}

OptionalErrorMessage DatabaseManagerSQLite::ensureOpen() {
  if (!db_) {
    if (const auto error = init(); error.has_value()) {
      return error;
    }
  }

  if (!db_) {
    return std::string("Database is not initialized or opened.");
  }

  return std::nullopt;
}

void DatabaseManagerSQLite::upsertPeerStatistics(const std::string &peer,
                                                 int runs, int failedRuns,
                                                 int csvExports,
                                                 int64_t addresses) {
  SQLite::Statement queryCheck(
      *db_, std::string("SELECT nb_of_runs, nb_of_failed_runs, "
                        "nb_of_csv_exports, addresses_processed FROM ") +
                statisticsTable_ + " WHERE peer = ?;");
  queryCheck.bind(1, peer);

  if (queryCheck.executeStep()) {
    SQLite::Statement queryUpdate(
        *db_, std::string("UPDATE ") + statisticsTable_ +
                  " SET nb_of_runs = ?, nb_of_failed_runs = ?, "
                  "nb_of_csv_exports = ?, addresses_processed = ? "
                  "WHERE peer = ?;");
    queryUpdate.bind(1, queryCheck.getColumn(0).getInt() + runs);
    queryUpdate.bind(2, queryCheck.getColumn(1).getInt() + failedRuns);
    queryUpdate.bind(3, queryCheck.getColumn(2).getInt() + csvExports);
    queryUpdate.bind(4, queryCheck.getColumn(3).getInt64() + addresses);
    queryUpdate.bind(5, peer);
    queryUpdate.exec();
    return;
  }

  SQLite::Statement queryInsert(
      *db_, std::string("INSERT INTO ") + statisticsTable_ +
                " (peer, nb_of_runs, nb_of_failed_runs, nb_of_csv_exports, "
                "addresses_processed) VALUES (?, ?, ?, ?, ?);");
  queryInsert.bind(1, peer);
  queryInsert.bind(2, runs);
  queryInsert.bind(3, failedRuns);
  queryInsert.bind(4, csvExports);
  queryInsert.bind(5, addresses);
  queryInsert.exec();
  std::cout << "New statistics entry created for: " << peer << std::endl;
}

OptionalErrorMessage DatabaseManagerSQLite::recordSanitizationRun(
    std::string_view peer, const SanitizationRunRecord &record) noexcept {
  if (const auto error = ensureOpen(); error.has_value()) {
    return error;
  }

  try {
    const std::string peerStd(peer);
    SQLite::Transaction transaction(*db_);

    SQLite::Statement queryInsert(
        *db_, std::string("INSERT INTO ") + runsTable_ +
                  " (peer, succeeded, total, valid, invalid, duplicates, "
                  "warnings, duration_ms) VALUES (?, 1, ?, ?, ?, ?, ?, ?);");
    queryInsert.bind(1, peerStd);
    queryInsert.bind(2, static_cast<int64_t>(record.stats.total));
    queryInsert.bind(3, static_cast<int64_t>(record.stats.valid));
    queryInsert.bind(4, static_cast<int64_t>(record.stats.invalid));
    queryInsert.bind(5, static_cast<int64_t>(record.stats.duplicates));
    queryInsert.bind(6, static_cast<int64_t>(record.warnings));
    queryInsert.bind(7, static_cast<int64_t>(record.durationMs));
    queryInsert.exec();

    upsertPeerStatistics(peerStd, 1, 0, 0,
                         static_cast<int64_t>(record.stats.total));
    transaction.commit();

    std::cout << "Recorded sanitization run for: " << peerStd << std::endl;
  } catch (const std::exception &ex) {
    return std::string("Failed to record sanitization run: ") + ex.what();
  }

  return std::nullopt;
}

OptionalErrorMessage
DatabaseManagerSQLite::recordFailedRun(std::string_view peer,
                                       std::string_view error) noexcept {
  if (const auto openError = ensureOpen(); openError.has_value()) {
    return openError;
  }

  try {
    const std::string peerStd(peer);
    SQLite::Transaction transaction(*db_);

    SQLite::Statement queryInsert(
        *db_, std::string("INSERT INTO ") + runsTable_ +
                  " (peer, succeeded, error) VALUES (?, 0, ?);");
    queryInsert.bind(1, peerStd);
    queryInsert.bind(2, std::string(error));
    queryInsert.exec();

    upsertPeerStatistics(peerStd, 0, 1, 0, 0);
    transaction.commit();

    std::cout << "Recorded failed sanitization run for: " << peerStd
              << std::endl;
  } catch (const std::exception &ex) {
    return std::string("Failed to record failed run: ") + ex.what();
  }

  return std::nullopt;
}

OptionalErrorMessage
DatabaseManagerSQLite::incrementCsvExports(std::string_view peer) noexcept {
  if (const auto error = ensureOpen(); error.has_value()) {
    return error;
  }

  try {
    upsertPeerStatistics(std::string(peer), 0, 0, 1, 0);
  } catch (const std::exception &ex) {
    return std::string("Failed to update csv export count: ") + ex.what();
  }

  return std::nullopt;
}

OptionalErrorMessage
DatabaseManagerSQLite::printStatisticsTableContent() noexcept {
  if (const auto error = ensureOpen(); error.has_value()) {
    return error;
  }

  try {
    SQLite::Statement query(
        *db_, std::string("SELECT peer, nb_of_runs, nb_of_failed_runs, "
                          "nb_of_csv_exports, addresses_processed FROM ") +
                  statisticsTable_ + " ORDER BY peer;");

    if (!query.executeStep()) {
      std::cout << "Statistics table is empty." << std::endl;
      return std::nullopt;
    }

    std::cout << "Statistics:" << std::endl;
    std::cout << std::left << std::setw(24) << "peer" << " | " << std::right
              << std::setw(6) << "runs" << " | " << std::setw(6) << "failed"
              << " | " << std::setw(11) << "csv_exports" << " | "
              << std::setw(19) << "addresses_processed" << std::endl;
    std::cout << std::string(78, '-') << std::endl;

    do {
      const std::string peer = query.getColumn(0).getString();
      const int runs = query.getColumn(1).getInt();
      const int failedRuns = query.getColumn(2).getInt();
      const int csvExports = query.getColumn(3).getInt();
      const int64_t addresses = query.getColumn(4).getInt64();

      std::cout << std::left << std::setw(24) << peer << " | " << std::right
                << std::setw(6) << runs << " | " << std::setw(6) << failedRuns
                << " | " << std::setw(11) << csvExports << " | "
                << std::setw(19) << addresses << std::endl;
    } while (query.executeStep());
  } catch (const std::exception &ex) {
    return std::string("Failed to read statistics table: ") + ex.what();
  }

  return std::nullopt;
}

} // namespace database
