#include "connection.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "packet_codec.hpp"

namespace machdap::rsp {

namespace {

std::span<const std::byte> as_bytes(std::string_view text) {
  return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

bool is_error_reply(std::string_view body) {
  return body.size() == 3 && body[0] == 'E' && hex_to_nibble(body[1]) != 0xff && hex_to_nibble(body[2]) != 0xff;
}

bool is_output_packet(std::string_view body) {
  if (body.size() < 2 || body[0] != 'O' || body == "OK" || (body.size() - 1) % 2 != 0) {
    return false;
  }
  for (size_t i = 1; i < body.size(); ++i) {
    if (hex_to_nibble(body[i]) == 0xff) {
      return false;
    }
  }
  return true;
}

remote_event make_event(remote_event::kind kind) {
  remote_event event;
  event.type = kind;
  return event;
}

} // namespace

const char* connection_state_name(connection_state state) {
  switch (state) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::connecting:
    return "connecting";
  case connection_state::handshaking:
    return "handshaking";
  case connection_state::ready:
    return "ready";
  default:
    return "unknown";
  }
}

connection::connection(config config, transport_factory factory, remote_event_sink sink)
    : config_(config), factory_(std::move(factory)), sink_(std::move(sink)) {}

connection::~connection() { close(); }

void connection::connect(const std::string& host, uint16_t port) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    host_ = host;
    port_ = port;
    have_address_ = true;
  }
  log_.inf("connecting to debugserver", redlog::field("host", host), redlog::field("port", port));
  start_worker();
}

connection_state connection::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

size_t connection::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool connection::no_ack_mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return no_ack_mode_;
}

void connection::send(command cmd) {
  std::vector<remote_event> events;
  bool reconnect = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.trc("send", redlog::field("packet", cmd.payload), redlog::field("state", connection_state_name(state_)));
    outgoing entry;
    entry.packet = encode_packet(cmd.payload);
    entry.cmd = std::move(cmd);
    queue_.push_back(std::move(entry));
    if (state_ == connection_state::ready) {
      if (!flush_locked()) {
        drop_connection_locked(
            remote_event::kind::disconnected, make_error_result(error_code::remote_unavailable, "write failed"), events
        );
      }
    } else {
      reconnect = state_ == connection_state::disconnected && have_address_;
    }
  }
  emit(events);
  if (reconnect) {
    log_.vrb("reconnecting for queued command");
    start_worker();
  }
}

result connection::request(const command& cmd, std::string& reply) {
  auto slot = std::make_shared<reply_slot>();
  std::vector<remote_event> events;
  result status = make_success_result();
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != connection_state::ready) {
      return make_error_result(error_code::remote_unavailable, std::string("cannot send ") + command_kind_name(cmd.kind));
    }

    outgoing entry;
    entry.cmd = cmd;
    entry.packet = encode_packet(cmd.payload);
    entry.slot = slot;
    queue_.push_back(std::move(entry));
    if (!flush_locked()) {
      drop_connection_locked(
          remote_event::kind::disconnected, make_error_result(error_code::remote_unavailable, "write failed"), events
      );
      status = make_error_result(error_code::remote_unavailable, "write failed");
    } else if (!reply_cv_.wait_for(lock, config_.reply_timeout, [&] { return slot->done; })) {
      status = make_error_result(error_code::timeout, std::string("no reply to ") + command_kind_name(cmd.kind));
      remote_event warning = make_event(remote_event::kind::warning);
      warning.command = cmd.kind;
      warning.error = status;
      warning.text = status.error_message;
      events.push_back(std::move(warning));
      // replies can no longer be paired with their packets; the next send reconnects
      drop_connection_locked(remote_event::kind::disconnected, status, events);
    } else {
      reply = slot->body;
      status = slot->status;
    }
  }
  emit(events);
  if (!status) {
    log_.dbg("request failed", redlog::field("packet", cmd.payload), redlog::field("error", status.error_message));
  }
  return status;
}

result connection::interrupt() {
  std::vector<remote_event> events;
  result status = make_success_result();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != connection_state::ready) {
      return make_error_result(error_code::remote_unavailable, "cannot interrupt");
    }
    if (!write_raw(std::string_view(&k_interrupt, 1))) {
      status = make_error_result(error_code::remote_unavailable, "write failed");
      drop_connection_locked(remote_event::kind::disconnected, status, events);
    }
  }
  emit(events);
  return status;
}

void connection::close() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    have_address_ = false;
    running_ = false;
    if (transport_) {
      transport_->disconnect();
    }
    state_ = connection_state::disconnected;
    for (auto& waiting : pending_) {
      if (waiting.slot) {
        waiting.slot->done = true;
        waiting.slot->status = make_error_result(error_code::remote_unavailable, "connection closed");
      }
    }
    pending_.clear();
    queue_.clear();
    in_flight_ = false;
    reply_cv_.notify_all();
    worker = std::move(worker_);
  }
  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (transport_) {
    transport_->close();
  }
}

void connection::start_worker() {
  std::thread previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != connection_state::disconnected || !have_address_) {
      return;
    }
    previous = std::move(worker_);
  }
  if (previous.joinable()) {
    if (previous.get_id() == std::this_thread::get_id()) {
      previous.detach();
    } else {
      previous.join();
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != connection_state::disconnected || !have_address_) {
    return;
  }
  if (transport_) {
    transport_->close();
  }
  transport_ = factory_();
  reader_.clear();
  pending_.clear();
  no_ack_mode_ = false;
  in_flight_ = false;
  bad_replies_ = 0;
  state_ = connection_state::connecting;
  running_ = true;
  worker_ = std::thread(&connection::worker_main, this, host_, port_);
}

void connection::worker_main(std::string host, uint16_t port) {
  std::vector<remote_event> events;
  std::string error;

  if (!transport_->connect(host, port, error)) {
    log_.wrn("connect failed", redlog::field("error", error));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = connection_state::disconnected;
      running_ = false;
    }
    remote_event failed = make_event(remote_event::kind::connect_failed);
    failed.error = make_error_result(error_code::remote_unavailable, error);
    events.push_back(std::move(failed));
    emit(events);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    state_ = connection_state::handshaking;
  }

  std::optional<stop_reply> initial;
  if (!handshake(initial, error)) {
    log_.wrn("handshake failed", redlog::field("error", error));
    transport_->disconnect();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = connection_state::disconnected;
      running_ = false;
    }
    remote_event failed = make_event(remote_event::kind::connect_failed);
    failed.error = make_error_result(error_code::remote_unavailable, "handshake: " + error);
    events.push_back(std::move(failed));
    emit(events);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    state_ = connection_state::ready;
    log_.inf(
        "debugserver ready", redlog::field("no_ack", no_ack_mode_), redlog::field("queued", queue_.size())
    );
    // a queued resume supersedes the halt reason
    bool resumed = std::any_of(queue_.begin(), queue_.end(), [](const outgoing& entry) {
      return entry.cmd.kind == command_kind::resume || entry.cmd.kind == command_kind::step;
    });
    if (!flush_locked()) {
      drop_connection_locked(
          remote_event::kind::disconnected, make_error_result(error_code::remote_unavailable, "write failed"), events
      );
      emit(events);
      return;
    }
    remote_event connected = make_event(remote_event::kind::connected);
    if (!resumed) {
      connected.stop = initial;
    }
    events.push_back(std::move(connected));
  }
  emit(events);

  reader_loop();
}

bool connection::handshake(std::optional<stop_reply>& initial, std::string& error) {
  std::string reply;
  if (!exchange(make_query_supported(), reply, error)) {
    return false;
  }
  log_.dbg("qSupported", redlog::field("features", reply));

  if (reply.find("QStartNoAckMode+") != std::string::npos) {
    if (!exchange(make_start_no_ack_mode(), reply, error)) {
      return false;
    }
    if (reply != "OK") {
      error = "QStartNoAckMode rejected: " + reply;
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    no_ack_mode_ = true;
  }

  if (!exchange(make_query_halt_reason(), reply, error)) {
    return false;
  }
  initial = parse_stop_reply(reply);
  if (!initial && reply != "OK") {
    error = "unexpected halt reason: " + reply;
    return false;
  }
  return true;
}

bool connection::exchange(const command& cmd, std::string& reply, std::string& error) {
  std::string packet = encode_packet(cmd.payload);
  bool ack_mode = !no_ack_mode();
  int bad = 0;
  int retransmits = 0;

  if (!write_raw(packet)) {
    error = "write failed";
    return false;
  }

  for (;;) {
    frame received;
    if (!read_frame(received, config_.reply_timeout, error)) {
      return false;
    }
    switch (received.type) {
    case frame::kind::ack:
    case frame::kind::interrupt:
    case frame::kind::notification:
      continue;
    case frame::kind::nack:
      if (ack_mode && ++retransmits <= config_.max_bad_replies) {
        if (!write_raw(packet)) {
          error = "write failed";
          return false;
        }
        continue;
      }
      error = "stub rejected " + cmd.payload;
      return false;
    case frame::kind::packet:
      break;
    }

    if (!received.valid) {
      log_.wrn("bad reply during handshake", redlog::field("error", received.error));
      if (ack_mode) {
        write_raw(std::string_view(&k_nack, 1));
      }
      if (++bad >= config_.max_bad_replies) {
        error = "repeated corrupt replies to " + cmd.payload;
        return false;
      }
      continue;
    }
    if (ack_mode) {
      write_raw(std::string_view(&k_ack, 1));
    }
    reply = received.body;
    return true;
  }
}

bool connection::read_frame(frame& out, std::chrono::milliseconds timeout, std::string& error) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<std::byte, 4096> buffer{};
  while (!reader_.next(out)) {
    if (!running_) {
      error = "connection closed";
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      error = "timed out waiting for reply";
      return false;
    }
    if (!transport_->readable(config_.poll_interval)) {
      if (!transport_->connected()) {
        error = "connection closed";
        return false;
      }
      continue;
    }
    long n = transport_->read(buffer);
    if (n <= 0) {
      error = "connection closed by stub";
      return false;
    }
    reader_.append(std::string_view(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(n)));
  }
  return true;
}

bool connection::write_raw(std::string_view bytes) {
  if (!transport_) {
    return false;
  }
  log_.ped("write", redlog::field("bytes", std::string(bytes)));
  return transport_->write(as_bytes(bytes));
}

void connection::reader_loop() {
  std::array<std::byte, 4096> buffer{};
  while (running_) {
    std::vector<remote_event> events;
    if (!transport_->readable(config_.poll_interval)) {
      if (transport_->connected()) {
        continue;
      }
      std::lock_guard<std::mutex> lock(mutex_);
      if (running_) {
        drop_connection_locked(
            remote_event::kind::disconnected, make_error_result(error_code::remote_unavailable, "connection lost"),
            events
        );
      }
    } else {
      long n = transport_->read(buffer);
      std::lock_guard<std::mutex> lock(mutex_);
      if (n <= 0) {
        if (running_) {
          drop_connection_locked(
              remote_event::kind::disconnected,
              make_error_result(error_code::remote_unavailable, "connection closed by stub"), events
          );
        }
      } else {
        reader_.append(std::string_view(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(n)));
        frame received;
        while (state_ == connection_state::ready && reader_.next(received)) {
          handle_frame(received, events);
        }
      }
    }
    emit(events);
  }
  log_.dbg("reader stopped");
}

void connection::handle_frame(const frame& received, std::vector<remote_event>& events) {
  switch (received.type) {
  case frame::kind::ack:
    if (!no_ack_mode_ && in_flight_ && !queue_.empty()) {
      outgoing entry = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = false;
      if (entry.cmd.reply != reply_kind::none) {
        pending_.push_back(expectation{entry.cmd.kind, entry.cmd.reply, entry.cmd.tag, entry.slot});
      }
      if (!flush_locked()) {
        drop_connection_locked(
            remote_event::kind::disconnected, make_error_result(error_code::remote_unavailable, "write failed"), events
        );
      }
    }
    return;
  case frame::kind::nack:
    if (!no_ack_mode_ && in_flight_ && !queue_.empty()) {
      log_.dbg("retransmitting", redlog::field("packet", queue_.front().cmd.payload));
      write_raw(queue_.front().packet);
    }
    return;
  case frame::kind::interrupt:
    return;
  case frame::kind::notification:
    log_.dbg("ignoring notification", redlog::field("body", received.body));
    return;
  case frame::kind::packet:
    break;
  }

  if (!received.valid) {
    ++bad_replies_;
    log_.wrn("corrupt reply", redlog::field("error", received.error), redlog::field("count", bad_replies_));
    if (!no_ack_mode_) {
      write_raw(std::string_view(&k_nack, 1));
    }
    if (bad_replies_ >= config_.max_bad_replies) {
      drop_connection_locked(
          remote_event::kind::protocol_error,
          make_error_result(error_code::remote_protocol_error, "repeated checksum failures"), events
      );
    }
    return;
  }

  bad_replies_ = 0;
  if (!no_ack_mode_) {
    write_raw(std::string_view(&k_ack, 1));
  }
  handle_reply(received.body, events);
}

void connection::handle_reply(const std::string& body, std::vector<remote_event>& events) {
  log_.trc("reply", redlog::field("body", body));

  if (is_output_packet(body)) {
    remote_event output = make_event(remote_event::kind::output);
    output.text = hex_decode_text(std::string_view(body).substr(1));
    events.push_back(std::move(output));
    return;
  }

  if (auto stop = parse_stop_reply(body)) {
    // answers the oldest resume or step; with none outstanding the stop is asynchronous
    remote_event stopped = make_event(remote_event::kind::stopped);
    auto waiting = std::find_if(pending_.begin(), pending_.end(), [](const expectation& entry) {
      return entry.reply == reply_kind::stop;
    });
    if (waiting != pending_.end()) {
      stopped.command = waiting->kind;
      pending_.erase(waiting);
    }
    stopped.stop = std::move(stop);
    events.push_back(std::move(stopped));
    return;
  }

  if (pending_.empty()) {
    log_.dbg("unsolicited reply", redlog::field("body", body));
    return;
  }

  // a resume or step is only answered early when the stub refuses it
  if (pending_.front().reply == reply_kind::stop && (is_error_reply(body) || body.empty())) {
    expectation refused = pending_.front();
    pending_.pop_front();
    remote_event failed = make_event(remote_event::kind::command_failed);
    failed.command = refused.kind;
    failed.tag = refused.tag;
    failed.text = body;
    failed.error = make_error_result(
        error_code::remote_protocol_error, std::string(command_kind_name(refused.kind)) + " rejected: " + body
    );
    events.push_back(std::move(failed));
    return;
  }

  // status replies pass over a resume that is still running
  auto found = std::find_if(pending_.begin(), pending_.end(), [](const expectation& entry) {
    return entry.reply != reply_kind::stop;
  });
  if (found == pending_.end()) {
    log_.dbg("ignoring reply while waiting for stop", redlog::field("body", body));
    return;
  }
  expectation answered = *found;
  pending_.erase(found);
  if (answered.slot) {
    answered.slot->body = body;
    answered.slot->status = is_error_reply(body)
                                ? make_error_result(
                                      error_code::remote_protocol_error,
                                      std::string(command_kind_name(answered.kind)) + " rejected: " + body
                                  )
                                : make_success_result();
    answered.slot->done = true;
    reply_cv_.notify_all();
    return;
  }

  if (is_error_reply(body) || (body.empty() && answered.kind == command_kind::insert_breakpoint)) {
    remote_event failed = make_event(remote_event::kind::command_failed);
    failed.command = answered.kind;
    failed.tag = answered.tag;
    failed.text = body;
    failed.error = make_error_result(
        error_code::remote_protocol_error, std::string(command_kind_name(answered.kind)) + " rejected: " +
                                               (body.empty() ? std::string("unsupported") : body)
    );
    events.push_back(std::move(failed));
  }
}

bool connection::transmit_locked(outgoing& entry) {
  if (!write_raw(entry.packet)) {
    return false;
  }
  if (entry.cmd.reply != reply_kind::none) {
    pending_.push_back(expectation{entry.cmd.kind, entry.cmd.reply, entry.cmd.tag, entry.slot});
  }
  return true;
}

bool connection::flush_locked() {
  if (no_ack_mode_) {
    while (!queue_.empty()) {
      if (!transmit_locked(queue_.front())) {
        return false;
      }
      queue_.pop_front();
    }
    return true;
  }
  if (in_flight_ || queue_.empty()) {
    return true;
  }
  if (!write_raw(queue_.front().packet)) {
    return false;
  }
  in_flight_ = true;
  return true;
}

void connection::drop_connection_locked(remote_event::kind kind, result error, std::vector<remote_event>& events) {
  log_.wrn(
      "connection dropped", redlog::field("error", error.error_message), redlog::field("queued", queue_.size())
  );
  state_ = connection_state::disconnected;
  running_ = false;
  in_flight_ = false;
  bad_replies_ = 0;
  for (auto& waiting : pending_) {
    if (waiting.slot) {
      waiting.slot->done = true;
      waiting.slot->status = error;
    }
  }
  pending_.clear();
  reply_cv_.notify_all();
  if (transport_) {
    transport_->disconnect();
  }

  remote_event dropped = make_event(kind);
  dropped.error = std::move(error);
  dropped.text = dropped.error.error_message;
  events.push_back(std::move(dropped));
}

void connection::emit(std::vector<remote_event>& events) {
  for (auto& event : events) {
    if (sink_) {
      sink_(std::move(event));
    }
  }
  events.clear();
}

} // namespace machdap::rsp
