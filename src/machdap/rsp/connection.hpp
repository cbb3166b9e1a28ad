#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <redlog.hpp>

#include "packet_reader.hpp"
#include "remote_target.hpp"
#include "transport.hpp"

namespace machdap::rsp {

// gdb-remote client connection
//
// Commands issued before the connection is ready are queued and flushed, in issue order, as part of the
// transition to ready. A worker thread owns connect, handshake and the inbound stream; stop replies, console
// output and failures of fire-and-forget commands are published through the event sink from that thread.
class connection final : public remote_target {
public:
  struct config {
    std::chrono::milliseconds reply_timeout{5000};
    std::chrono::milliseconds poll_interval{50};
    int max_bad_replies = 2;
  };

  using transport_factory = std::function<std::unique_ptr<transport>()>;

  connection(config config, transport_factory factory, remote_event_sink sink);
  ~connection() override;

  connection(const connection&) = delete;
  connection& operator=(const connection&) = delete;

  void connect(const std::string& host, uint16_t port) override;
  connection_state state() const override;
  void send(command cmd) override;
  result request(const command& cmd, std::string& reply) override;
  result interrupt() override;
  void close() override;

  size_t queued() const;
  bool no_ack_mode() const;

private:
  struct reply_slot {
    bool done = false;
    result status = make_success_result();
    std::string body;
  };

  struct outgoing {
    command cmd;
    std::string packet;
    std::shared_ptr<reply_slot> slot;
  };

  struct expectation {
    command_kind kind = command_kind::query_halt_reason;
    reply_kind reply = reply_kind::status;
    uint64_t tag = 0;
    std::shared_ptr<reply_slot> slot;
  };

  void start_worker();
  void worker_main(std::string host, uint16_t port);
  bool handshake(std::optional<stop_reply>& initial, std::string& error);
  bool exchange(const command& cmd, std::string& reply, std::string& error);
  bool read_frame(frame& out, std::chrono::milliseconds timeout, std::string& error);
  bool write_raw(std::string_view bytes);
  void reader_loop();

  void handle_frame(const frame& received, std::vector<remote_event>& events);
  void handle_reply(const std::string& body, std::vector<remote_event>& events);
  bool transmit_locked(outgoing& entry);
  bool flush_locked();
  void drop_connection_locked(remote_event::kind kind, result error, std::vector<remote_event>& events);
  void emit(std::vector<remote_event>& events);

  config config_{};
  transport_factory factory_{};
  remote_event_sink sink_{};
  redlog::logger log_{"machdap.rsp.connection"};

  mutable std::mutex mutex_{};
  std::condition_variable reply_cv_{};
  connection_state state_ = connection_state::disconnected;
  std::deque<outgoing> queue_{};
  std::deque<expectation> pending_{};
  bool no_ack_mode_ = false;
  bool in_flight_ = false;
  int bad_replies_ = 0;
  std::string host_{};
  uint16_t port_ = 0;
  bool have_address_ = false;

  std::unique_ptr<transport> transport_{};
  packet_reader reader_{};
  std::thread worker_{};
  std::atomic<bool> running_{false};
};

} // namespace machdap::rsp
