#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "machdap/base/error.hpp"

#include "commands.hpp"
#include "stop_reply.hpp"

namespace machdap::rsp {

enum class connection_state { disconnected, connecting, handshaking, ready };

const char* connection_state_name(connection_state state);

struct remote_event {
  enum class kind {
    connected,
    connect_failed,
    stopped,
    output,
    command_failed,
    protocol_error,
    disconnected,
    warning,
  };

  kind type = kind::warning;
  // stop reply for `stopped`, initial halt reason for `connected`
  std::optional<stop_reply> stop;
  // console text for `output`, raw reply for `command_failed`
  std::string text;
  command_kind command = command_kind::query_halt_reason;
  uint64_t tag = 0;
  result error = make_success_result();
};

using remote_event_sink = std::function<void(remote_event)>;

// what the session and breakpoint table need from a debug stub
class remote_target {
public:
  virtual ~remote_target() = default;

  // asynchronous; progress is reported through the event sink
  virtual void connect(const std::string& host, uint16_t port) = 0;
  virtual connection_state state() const = 0;

  // never fails: queued until the connection is ready, replies and failures arrive as events
  virtual void send(command cmd) = 0;

  // blocking query; only valid once ready
  virtual result request(const command& cmd, std::string& reply) = 0;

  virtual result interrupt() = 0;
  virtual void close() = 0;
};

} // namespace machdap::rsp
