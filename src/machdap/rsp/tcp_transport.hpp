#pragma once

#include <atomic>
#include <chrono>
#include <utility>

#include "transport.hpp"

struct addrinfo;

namespace machdap::rsp {

namespace detail {

// RAII socket wrapper with move semantics
class socket {
public:
  socket() = default;
  explicit socket(int fd) noexcept : fd_(fd) {}

  socket(socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  socket& operator=(socket&& other) noexcept {
    if (this != &other) {
      close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  socket(const socket&) = delete;
  socket& operator=(const socket&) = delete;

  ~socket() { close(); }

  void close() noexcept;

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }
  explicit operator bool() const noexcept { return valid(); }

private:
  int fd_ = -1;
};

} // namespace detail

class tcp_transport final : public transport {
public:
  tcp_transport() = default;
  explicit tcp_transport(std::chrono::milliseconds connect_timeout) : connect_timeout_(connect_timeout) {}

  bool connect(const std::string& host, uint16_t port, std::string& error) override;
  bool connected() const override;
  bool readable(std::chrono::milliseconds timeout) override;
  long read(std::span<std::byte> out) override;
  bool write(std::span<const std::byte> data) override;
  void disconnect() override;
  void close() override;

private:
  bool connect_candidate(const detail::socket& candidate, const addrinfo& entry, int& error_number);

  std::chrono::milliseconds connect_timeout_{5000};
  detail::socket sock_{};
  std::atomic<bool> connected_{false};
  // set by disconnect(); aborts a connect in progress
  std::atomic<bool> cancelled_{false};
};

} // namespace machdap::rsp
