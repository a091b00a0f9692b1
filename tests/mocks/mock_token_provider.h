#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "tokenkeeper/client/lifecycle_observer.h"
#include "tokenkeeper/client/token_provider.h"

namespace tokenkeeper {
namespace test {

class MockTokenProvider : public client::TokenProvider {
 public:
  MOCK_METHOD(Result<client::AccessToken>,
              acquire,
              (const credentials::CredentialSnapshot& credentials,
               const std::vector<std::string>& scopes),
              (override));
};

// Records events for assertions on order and count
class RecordingObserver : public client::LifecycleObserver {
 public:
  void onLifecycleEvent(const client::LifecycleEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<client::LifecycleEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  size_t count(client::LifecycleEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& event : events_) {
      if (event.type == type) {
        ++n;
      }
    }
    return n;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<client::LifecycleEvent> events_;
};

}  // namespace test
}  // namespace tokenkeeper
