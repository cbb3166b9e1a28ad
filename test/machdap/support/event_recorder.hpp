#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "machdap/rsp/remote_target.hpp"

namespace machdap::test {

// thread-safe sink for connection events
class event_recorder {
public:
  rsp::remote_event_sink sink() {
    return [this](rsp::remote_event event) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
      }
      cv_.notify_all();
    };
  }

  // the `nth` (zero based) event of `kind`, waiting for it to arrive
  std::optional<rsp::remote_event> wait_for(
      rsp::remote_event::kind kind, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000), size_t nth = 0
  ) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::optional<rsp::remote_event> found;
    cv_.wait_for(lock, timeout, [&] {
      size_t seen = 0;
      for (const auto& event : events_) {
        if (event.type == kind && seen++ == nth) {
          found = event;
          return true;
        }
      }
      return false;
    });
    return found;
  }

  size_t count(rsp::remote_event::kind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& event : events_) {
      if (event.type == kind) {
        ++total;
      }
    }
    return total;
  }

private:
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  std::vector<rsp::remote_event> events_{};
};

} // namespace machdap::test
