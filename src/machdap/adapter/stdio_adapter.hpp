#pragma once

#include <atomic>
#include <ostream>
#include <thread>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "machdap/dap/message_stream.hpp"
#include "machdap/session/session.hpp"

namespace machdap::adapter {

// session output framed onto a stream
class stream_sink final : public session::message_sink {
public:
  explicit stream_sink(std::ostream& out) : writer_(out) {}

  void send(const nlohmann::json& message) override;

private:
  dap::message_writer writer_;
  redlog::logger log_{"machdap.dap.sink"};
};

// DAP over a pair of byte streams
//
// A reader thread decodes frames from `input_fd` and queues them for the session thread, which runs on the
// caller of run(). The reader stops at end of stream, on a framing error, or when the session finishes.
class stdio_adapter {
public:
  stdio_adapter(session::session_options options, int input_fd, std::ostream& output);
  ~stdio_adapter();

  stdio_adapter(const stdio_adapter&) = delete;
  stdio_adapter& operator=(const stdio_adapter&) = delete;

  // returns the process exit code
  int run();

private:
  void reader_main();

  int input_fd_ = -1;
  stream_sink sink_;
  session::session session_;
  std::thread reader_{};
  std::atomic<bool> running_{false};
  redlog::logger log_{"machdap.dap.reader"};
};

} // namespace machdap::adapter
