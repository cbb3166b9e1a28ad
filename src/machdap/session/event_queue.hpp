#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include "machdap/base/error.hpp"
#include "machdap/dap/protocol.hpp"
#include "machdap/rsp/remote_target.hpp"

namespace machdap::session {

struct session_event {
  enum class kind {
    // a parsed DAP request from the client reader
    request,
    // client stream reached end of file
    client_closed,
    // client stream desynchronized; fatal
    client_error,
    // published by the remote reader thread
    remote,
  };

  kind type = kind::request;
  dap::request request;
  rsp::remote_event remote;
  // connection that published a remote event; stale connections are ignored
  uint64_t generation = 0;
  result error = make_success_result();

  static session_event from_request(dap::request req) {
    session_event event;
    event.type = kind::request;
    event.request = std::move(req);
    return event;
  }

  static session_event from_remote(rsp::remote_event remote_event, uint64_t generation = 0) {
    session_event event;
    event.type = kind::remote;
    event.remote = std::move(remote_event);
    event.generation = generation;
    return event;
  }
};

// multi-producer, single-consumer; the session thread is the only consumer
class event_queue {
public:
  void push(session_event event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(std::move(event));
    }
    cv_.notify_one();
  }

  bool poll(session_event& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
      return false;
    }
    out = std::move(events_.front());
    events_.pop_front();
    return true;
  }

  bool wait_pop(session_event& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
      return false;
    }
    out = std::move(events_.front());
    events_.pop_front();
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
  }

private:
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  std::deque<session_event> events_{};
};

} // namespace machdap::session
