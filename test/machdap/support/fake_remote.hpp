#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "machdap/rsp/remote_target.hpp"

namespace machdap::test {

// remote_target that records traffic; the test publishes events and scripts request replies by payload
class fake_remote final : public rsp::remote_target {
public:
  explicit fake_remote(rsp::remote_event_sink sink) : sink_(std::move(sink)) {}

  void connect(const std::string& host, uint16_t port) override {
    host_ = host;
    port_ = port;
    ++connects_;
    state_ = rsp::connection_state::connecting;
  }

  rsp::connection_state state() const override { return state_; }

  void send(rsp::command cmd) override { sent_.push_back(std::move(cmd)); }

  result request(const rsp::command& cmd, std::string& reply) override {
    requests_.push_back(cmd.payload);
    if (state_ != rsp::connection_state::ready) {
      return make_error_result(error_code::remote_unavailable, "not connected");
    }
    auto found = replies_.find(cmd.payload);
    if (found == replies_.end()) {
      reply.clear();
      return make_success_result();
    }
    reply = found->second;
    return make_success_result();
  }

  result interrupt() override {
    ++interrupts_;
    return make_success_result();
  }

  void close() override {
    closed_ = true;
    state_ = rsp::connection_state::disconnected;
  }

  // test side
  void set_reply(const std::string& payload, const std::string& reply) { replies_[payload] = reply; }

  void publish(rsp::remote_event event) {
    if (event.type == rsp::remote_event::kind::connected) {
      state_ = rsp::connection_state::ready;
    } else if (event.type == rsp::remote_event::kind::disconnected ||
               event.type == rsp::remote_event::kind::protocol_error) {
      state_ = rsp::connection_state::disconnected;
    }
    sink_(std::move(event));
  }

  std::vector<std::string> sent_payloads() const {
    std::vector<std::string> out;
    for (const auto& cmd : sent_) {
      out.push_back(cmd.payload);
    }
    return out;
  }

  size_t count_sent(rsp::command_kind kind) const {
    size_t count = 0;
    for (const auto& cmd : sent_) {
      if (cmd.kind == kind) {
        ++count;
      }
    }
    return count;
  }

  const std::vector<rsp::command>& sent() const { return sent_; }
  const std::vector<std::string>& requests() const { return requests_; }
  size_t connects() const { return connects_; }
  size_t interrupts() const { return interrupts_; }
  bool closed() const { return closed_; }
  uint16_t port() const { return port_; }

private:
  rsp::remote_event_sink sink_;
  rsp::connection_state state_ = rsp::connection_state::disconnected;
  std::string host_;
  uint16_t port_ = 0;
  size_t connects_ = 0;
  size_t interrupts_ = 0;
  bool closed_ = false;
  std::vector<rsp::command> sent_;
  std::vector<std::string> requests_;
  std::map<std::string, std::string> replies_;
};

} // namespace machdap::test
