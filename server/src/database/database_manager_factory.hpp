#pragma once
#include "database/database_manager_sqlite.hpp"

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace database {

class DatabaseManagerFactory {
public:
  static std::expected<std::shared_ptr<DatabaseManagerSQLite>, std::string>
  createDatabaseManager(std::string dbPath) {
    auto dbMngr = std::make_shared<DatabaseManagerSQLite>(std::move(dbPath));

    if (auto error = dbMngr->init()) {
      return std::unexpected(std::move(*error));
    }

    return dbMngr;
  }
};
} // namespace database
