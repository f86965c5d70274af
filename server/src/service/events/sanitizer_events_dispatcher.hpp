#pragma once

#include "service/events/sanitizer_events.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace events {

class EventDispatcher {
public:
  EventDispatcher() = default;
  ~EventDispatcher() = default;

  // Delete copy/move operations
  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;
  EventDispatcher(EventDispatcher &&) = delete;
  EventDispatcher &operator=(EventDispatcher &&) = delete;

  // Register an observer - does not take ownership
  void registerObserver(std::weak_ptr<ISanitizerEventObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
  }

  void notifySanitizationCompleted(const SanitizationCompletedEvent &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &weakObserver : observers_) {
      if (auto observer = weakObserver.lock()) {
        observer->onSanitizationCompleted(event);
      }
    }
  }

  void notifySanitizationFailed(const SanitizationFailedEvent &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &weakObserver : observers_) {
      if (auto observer = weakObserver.lock()) {
        observer->onSanitizationFailed(event);
      }
    }
  }

  void notifyCsvExported(const CsvExportedEvent &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &weakObserver : observers_) {
      if (auto observer = weakObserver.lock()) {
        observer->onCsvExported(event);
      }
    }
  }

private:
  std::mutex mutex_;
  std::vector<std::weak_ptr<ISanitizerEventObserver>> observers_;
};

} // namespace events
