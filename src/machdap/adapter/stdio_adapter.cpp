#include "stdio_adapter.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>

#include <poll.h>
#include <unistd.h>

#include "machdap/dap/protocol.hpp"

namespace machdap::adapter {

namespace {

constexpr int k_poll_timeout_ms = 100;
constexpr size_t k_read_chunk = 64 * 1024;

session::session_event client_error(result error) {
  session::session_event event;
  event.type = session::session_event::kind::client_error;
  event.error = std::move(error);
  return event;
}

} // namespace

void stream_sink::send(const nlohmann::json& message) {
  if (!writer_.write(message)) {
    log_.err("failed to write message to client");
  }
}

stdio_adapter::stdio_adapter(session::session_options options, int input_fd, std::ostream& output)
    : input_fd_(input_fd), sink_(output), session_(std::move(options), sink_) {}

stdio_adapter::~stdio_adapter() {
  running_ = false;
  if (reader_.joinable()) {
    reader_.join();
  }
}

int stdio_adapter::run() {
  running_ = true;
  reader_ = std::thread(&stdio_adapter::reader_main, this);
  log_.inf("serving dap on stdio");

  int exit_code = session_.run();

  running_ = false;
  if (reader_.joinable()) {
    reader_.join();
  }
  log_.inf("session finished", redlog::field("exit_code", exit_code));
  return exit_code;
}

void stdio_adapter::reader_main() {
  dap::frame_decoder decoder;
  std::array<char, k_read_chunk> buffer{};
  auto& events = session_.events();

  while (running_) {
    pollfd pfd{};
    pfd.fd = input_fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, k_poll_timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      events.push(client_error(make_error_result(error_code::transport_framing, std::strerror(errno), errno)));
      return;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t count = ::read(input_fd_, buffer.data(), buffer.size());
    if (count < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      events.push(client_error(make_error_result(error_code::transport_framing, std::strerror(errno), errno)));
      return;
    }
    if (count == 0) {
      if (auto status = decoder.finish(); !status) {
        events.push(client_error(status));
        return;
      }
      session::session_event closed;
      closed.type = session::session_event::kind::client_closed;
      events.push(std::move(closed));
      return;
    }

    decoder.append(std::string_view(buffer.data(), static_cast<size_t>(count)));
    for (;;) {
      nlohmann::json message;
      result failure;
      auto status = decoder.next(message, failure);
      if (status == dap::frame_decoder::status::need_more) {
        break;
      }
      if (status == dap::frame_decoder::status::error) {
        log_.err("framing error", redlog::field("error", failure.error_message));
        events.push(client_error(failure));
        return;
      }

      dap::request req;
      std::string error;
      if (!dap::parse_request(message, req, error)) {
        log_.dbg("ignoring client message", redlog::field("reason", error));
        continue;
      }
      events.push(session::session_event::from_request(std::move(req)));
    }
  }
}

} // namespace machdap::adapter
