#include "tcp_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <redlog.hpp>

namespace machdap::rsp {

namespace {

auto log_tcp = redlog::get_logger("machdap.rsp.tcp");

#if defined(MSG_NOSIGNAL)
constexpr int k_send_flags = MSG_NOSIGNAL;
#else
constexpr int k_send_flags = 0;
#endif

constexpr std::chrono::milliseconds k_connect_slice{50};

void configure_socket(int fd) {
  int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
#if defined(SO_NOSIGPIPE)
  setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
}

} // namespace

namespace detail {

void socket::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace detail

bool tcp_transport::connect(const std::string& host, uint16_t port, std::string& error) {
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    error = std::string("resolve ") + host + ": " + gai_strerror(rc);
    return false;
  }

  int last_errno = 0;
  for (addrinfo* entry = results; entry != nullptr; entry = entry->ai_next) {
    detail::socket candidate(::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol));
    if (!candidate) {
      last_errno = errno;
      continue;
    }
    if (!connect_candidate(candidate, *entry, last_errno)) {
      if (cancelled_) {
        break;
      }
      continue;
    }
    configure_socket(candidate.get());
    sock_ = std::move(candidate);
    break;
  }
  ::freeaddrinfo(results);

  if (cancelled_) {
    sock_.close();
    error = "connect " + host + ":" + service + ": cancelled";
    return false;
  }
  if (!sock_) {
    error = "connect " + host + ":" + service + ": " +
            (last_errno == ETIMEDOUT ? std::string("timed out") : std::string(std::strerror(last_errno)));
    return false;
  }

  connected_ = true;
  log_tcp.dbg("connected", redlog::field("host", host), redlog::field("port", port));
  return true;
}

// non-blocking connect polled in short slices so disconnect() and the deadline both end it promptly
bool tcp_transport::connect_candidate(const detail::socket& candidate, const addrinfo& entry, int& error_number) {
  int flags = ::fcntl(candidate.get(), F_GETFL, 0);
  if (flags < 0 || ::fcntl(candidate.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
    error_number = errno;
    return false;
  }

  if (::connect(candidate.get(), entry.ai_addr, entry.ai_addrlen) != 0) {
    if (errno != EINPROGRESS) {
      error_number = errno;
      return false;
    }
    auto deadline = std::chrono::steady_clock::now() + connect_timeout_;
    for (;;) {
      if (cancelled_) {
        error_number = ECANCELED;
        return false;
      }
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        error_number = ETIMEDOUT;
        return false;
      }
      pollfd pfd{};
      pfd.fd = candidate.get();
      pfd.events = POLLOUT;
      int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, k_connect_slice).count()));
      if (rc < 0 && errno != EINTR) {
        error_number = errno;
        return false;
      }
      if (rc > 0) {
        break;
      }
    }
    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (::getsockopt(candidate.get(), SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0) {
      error_number = errno;
      return false;
    }
    if (socket_error != 0) {
      error_number = socket_error;
      return false;
    }
  }

  if (::fcntl(candidate.get(), F_SETFL, flags) < 0) {
    error_number = errno;
    return false;
  }
  return true;
}

bool tcp_transport::connected() const { return connected_ && sock_.valid(); }

bool tcp_transport::readable(std::chrono::milliseconds timeout) {
  if (!connected()) {
    return false;
  }
  pollfd pfd{};
  pfd.fd = sock_.get();
  pfd.events = POLLIN;
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

long tcp_transport::read(std::span<std::byte> out) {
  if (!connected()) {
    return -1;
  }
  ssize_t n = ::recv(sock_.get(), out.data(), out.size(), 0);
  if (n <= 0) {
    connected_ = false;
  }
  return static_cast<long>(n);
}

bool tcp_transport::write(std::span<const std::byte> data) {
  if (!connected()) {
    return false;
  }
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::send(sock_.get(), data.data() + total, data.size() - total, k_send_flags);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      log_tcp.dbg("write failed", redlog::field("errno", errno));
      connected_ = false;
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

void tcp_transport::disconnect() {
  cancelled_ = true;
  // sock_ is only published by connect() before connected_ is set
  if (connected_.exchange(false)) {
    ::shutdown(sock_.get(), SHUT_RDWR);
  }
}

void tcp_transport::close() {
  connected_ = false;
  sock_.close();
}

} // namespace machdap::rsp
