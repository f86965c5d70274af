#pragma once

#include <chrono>
#include <string>

#include "domain/sanitization_types.hpp"

namespace events {

// Event types emitted by the sanitizer service
struct SanitizationCompletedEvent {
  std::string peer;
  domain::SanitizationStats stats;
  std::size_t warnings = 0;
  std::chrono::steady_clock::duration duration{};
};

struct SanitizationFailedEvent {
  std::string peer;
  std::string error;
};

struct CsvExportedEvent {
  std::string peer;
  std::size_t rows = 0;
};

// Simple virtual interface for event observers
class ISanitizerEventObserver {
public:
  virtual ~ISanitizerEventObserver() = default;

  virtual void
  onSanitizationCompleted(const SanitizationCompletedEvent &event) = 0;
  virtual void onSanitizationFailed(const SanitizationFailedEvent &event) = 0;
  virtual void onCsvExported(const CsvExportedEvent &event) = 0;
};

} // namespace events
