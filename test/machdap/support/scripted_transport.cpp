#include "scripted_transport.hpp"

#include <algorithm>
#include <cstring>

#include "machdap/rsp/packet_codec.hpp"

namespace machdap::test {

scripted_stub::scripted_stub() {
  respond_ = [this](const std::string& payload) { return default_reply(payload); };
}

void scripted_stub::set_responder(responder respond) {
  std::lock_guard<std::mutex> lock(mutex_);
  respond_ = std::move(respond);
}

void scripted_stub::set_refuse_connect(bool refuse) {
  std::lock_guard<std::mutex> lock(mutex_);
  refuse_connect_ = refuse;
}

void scripted_stub::set_supports_no_ack(bool supported) {
  std::lock_guard<std::mutex> lock(mutex_);
  supports_no_ack_ = supported;
}

void scripted_stub::inject_raw(const std::string& bytes) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_ += bytes;
  }
  cv_.notify_all();
}

void scripted_stub::inject_packet(const std::string& body) { inject_raw(rsp::encode_packet(body)); }

std::vector<std::string> scripted_stub::received() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_;
}

bool scripted_stub::wait_received(size_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
}

size_t scripted_stub::connects() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connects_;
}

size_t scripted_stub::nacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nacks_;
}

bool scripted_stub::on_connect(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++connects_;
  if (refuse_connect_) {
    error = "connection refused";
    return false;
  }
  connected_ = true;
  no_ack_ = false;
  inbound_.clear();
  pending_write_.clear();
  return true;
}

bool scripted_stub::connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

bool scripted_stub::readable(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return !inbound_.empty() || !connected_; });
}

long scripted_stub::read(std::span<std::byte> out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (inbound_.empty()) {
    return connected_ ? -1 : 0;
  }
  size_t count = std::min(out.size(), inbound_.size());
  std::memcpy(out.data(), inbound_.data(), count);
  inbound_.erase(0, count);
  return static_cast<long>(count);
}

bool scripted_stub::write(std::span<const std::byte> data) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return false;
    }
    pending_write_.append(reinterpret_cast<const char*>(data.data()), data.size());
    process_locked();
  }
  cv_.notify_all();
  return true;
}

void scripted_stub::drop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
  }
  cv_.notify_all();
}

void scripted_stub::process_locked() {
  for (;;) {
    if (pending_write_.empty()) {
      return;
    }
    char first = pending_write_.front();
    if (first == rsp::k_ack) {
      pending_write_.erase(0, 1);
      continue;
    }
    if (first == rsp::k_nack) {
      ++nacks_;
      pending_write_.erase(0, 1);
      continue;
    }
    if (first == rsp::k_interrupt) {
      pending_write_.erase(0, 1);
      received_.emplace_back(1, rsp::k_interrupt);
      for (const auto& body : respond_(std::string(1, rsp::k_interrupt))) {
        reply_locked(body);
      }
      continue;
    }
    if (first != rsp::k_packet_start) {
      pending_write_.erase(0, 1);
      continue;
    }
    size_t hash = pending_write_.find(rsp::k_packet_end);
    if (hash == std::string::npos || hash + 2 >= pending_write_.size()) {
      return;
    }
    std::string payload = pending_write_.substr(1, hash - 1);
    pending_write_.erase(0, hash + 3);
    received_.push_back(payload);

    if (!no_ack_) {
      inbound_.push_back(rsp::k_ack);
    }
    std::vector<std::string> replies;
    if (payload.rfind("qSupported", 0) == 0) {
      replies.push_back(supports_no_ack_ ? "PacketSize=20000;QStartNoAckMode+" : "PacketSize=20000");
    } else if (payload == "QStartNoAckMode") {
      replies.push_back("OK");
    } else if (payload == "?") {
      replies.push_back("T05thread:1;");
    } else {
      replies = respond_(payload);
    }
    for (const auto& body : replies) {
      reply_locked(body);
    }
    if (payload == "QStartNoAckMode") {
      no_ack_ = true;
    }
  }
}

void scripted_stub::reply_locked(const std::string& body) { inbound_ += rsp::encode_packet(body); }

std::vector<std::string> scripted_stub::default_reply(const std::string& payload) const {
  if (payload.rfind("vCont", 0) == 0 || payload == "k" || payload == std::string(1, rsp::k_interrupt)) {
    return {};
  }
  return {"OK"};
}

bool scripted_transport::connect(const std::string&, uint16_t, std::string& error) {
  return stub_->on_connect(error);
}

} // namespace machdap::test
