#pragma once

#include "database/database_manager.hpp"
#include "service/events/sanitizer_events.hpp"

#include <chrono>
#include <iostream>
#include <memory>

#define DB_LOG_GET_OR_RETURN(var)                                              \
  auto var = getDatabase();                                                    \
  if (!var) {                                                                  \
    std::cerr << "Database unavailable in DatabaseEventLogger::" << __func__   \
              << std::endl;                                                    \
    return;                                                                    \
  }

namespace observers {

class DatabaseEventLogger : public events::ISanitizerEventObserver {
public:
  explicit DatabaseEventLogger(std::weak_ptr<database::IDatabaseManager> db)
      : db_(std::move(db)) {}

  void onSanitizationCompleted(
      const events::SanitizationCompletedEvent &event) override {
    DB_LOG_GET_OR_RETURN(db);

    const database::SanitizationRunRecord record{
        .stats = event.stats,
        .warnings = event.warnings,
        .durationMs = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                event.duration)
                .count()),
    };

    if (auto error = db->recordSanitizationRun(event.peer, record)) {
      std::cerr << "Database error on sanitization run: " << *error
                << std::endl;
    }
  }

  void
  onSanitizationFailed(const events::SanitizationFailedEvent &event) override {
    DB_LOG_GET_OR_RETURN(db);

    if (auto error = db->recordFailedRun(event.peer, event.error)) {
      std::cerr << "Database error on failed run: " << *error << std::endl;
    }
  }

  void onCsvExported(const events::CsvExportedEvent &event) override {
    DB_LOG_GET_OR_RETURN(db);

    if (auto error = db->incrementCsvExports(event.peer)) {
      std::cerr << "Database error on csv export: " << *error << std::endl;
    }
  }

private:
  std::shared_ptr<database::IDatabaseManager> getDatabase() {
    return db_.lock();
  }

  std::weak_ptr<database::IDatabaseManager> db_;
};

} // namespace observers
