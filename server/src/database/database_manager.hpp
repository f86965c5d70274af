#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/sanitization_types.hpp"

namespace database {

using OptionalErrorMessage = std::optional<std::string>;

struct SanitizationRunRecord {
  domain::SanitizationStats stats;
  std::size_t warnings = 0;
  uint64_t durationMs = 0;
};

/**
 * @brief Interface for persistence operations used by the server.
 */
class IDatabaseManager {
public:
  /**
   * @brief Virtual destructor for interface cleanup.
   */
  virtual ~IDatabaseManager() = default;

  /**
   * @brief Record a completed sanitization run for the given peer.
   * @param peer The gRPC peer that requested the run.
   * @param record Counters and duration of the run.
   * @return Empty on success, or error message on failure.
   */
  [[nodiscard]] virtual OptionalErrorMessage
  recordSanitizationRun(std::string_view peer,
                        const SanitizationRunRecord &record) noexcept = 0;

  /**
   * @brief Record a sanitization run aborted by a systemic failure.
   * @param peer The gRPC peer that requested the run.
   * @param error The error reported to the peer.
   * @return Empty on success, or error message on failure.
   */
  [[nodiscard]] virtual OptionalErrorMessage
  recordFailedRun(std::string_view peer, std::string_view error) noexcept = 0;

  /**
   * @brief Increment the CSV export count for the given peer.
   * @param peer The gRPC peer that requested the export.
   * @return Empty on success, or error message on failure.
   */
  [[nodiscard]] virtual OptionalErrorMessage
  incrementCsvExports(std::string_view peer) noexcept = 0;

  /**
   * @brief Emit the current per-peer statistics table content.
   * @return Empty on success, or error message on failure.
   */
  [[nodiscard]] virtual OptionalErrorMessage
  printStatisticsTableContent() noexcept = 0;
};

} // namespace database
