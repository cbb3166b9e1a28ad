#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "machdap/rsp/commands.hpp"
#include "machdap/rsp/connection.hpp"
#include "machdap/rsp/packet_codec.hpp"
#include "machdap/rsp/packet_reader.hpp"
#include "machdap/rsp/tcp_transport.hpp"
#include "machdap/support/event_recorder.hpp"

using namespace std::chrono_literals;

namespace {

// minimal debugserver on a loopback socket: handshake plus "OK" for everything else
class loopback_stub {
public:
  loopback_stub() {
    listener_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(listener_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bound_ = ::bind(listener_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && ::listen(listener_, 1) == 0;
    socklen_t len = sizeof(addr);
    if (bound_ && ::getsockname(listener_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~loopback_stub() {
    stop_ = true;
    if (thread_.joinable()) {
      thread_.join();
    }
    if (listener_ >= 0) {
      ::close(listener_);
    }
  }

  bool bound() const { return bound_ && port_ != 0; }
  uint16_t port() const { return port_; }

  void start() { thread_ = std::thread(&loopback_stub::serve, this); }

  bool wait_received(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
  }

  std::vector<std::string> received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

private:
  bool wait_readable(int fd) {
    while (!stop_) {
      pollfd pfd{fd, POLLIN, 0};
      int rc = ::poll(&pfd, 1, 20);
      if (rc > 0) {
        return true;
      }
      if (rc < 0) {
        return false;
      }
    }
    return false;
  }

  void send_all(int fd, const std::string& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
      ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, 0);
      if (n <= 0) {
        return;
      }
      sent += static_cast<size_t>(n);
    }
  }

  void serve() {
    if (!wait_readable(listener_)) {
      return;
    }
    int client = ::accept(listener_, nullptr, nullptr);
    if (client < 0) {
      return;
    }

    machdap::rsp::packet_reader reader;
    bool no_ack = false;
    char buffer[1024];
    while (wait_readable(client)) {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      reader.append(std::string_view(buffer, static_cast<size_t>(n)));
      machdap::rsp::frame received;
      while (reader.next(received)) {
        if (received.type != machdap::rsp::frame::kind::packet || !received.valid) {
          continue;
        }
        if (!no_ack) {
          send_all(client, "+");
        }
        std::string reply = "OK";
        if (received.body.rfind("qSupported", 0) == 0) {
          reply = "PacketSize=20000;QStartNoAckMode+";
        } else if (received.body == "?") {
          reply = "T11thread:a1;";
        }
        send_all(client, machdap::rsp::encode_packet(reply));
        if (received.body == "QStartNoAckMode") {
          no_ack = true;
        }
        {
          std::lock_guard<std::mutex> lock(mutex_);
          received_.push_back(received.body);
        }
        cv_.notify_all();
      }
    }
    ::close(client);
  }

  int listener_ = -1;
  bool bound_ = false;
  uint16_t port_ = 0;
  std::atomic<bool> stop_{false};
  std::thread thread_{};
  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::vector<std::string> received_{};
};

} // namespace

TEST_CASE("tcp connection handshakes and replays queued commands over loopback") {
  loopback_stub stub;
  REQUIRE(stub.bound());
  stub.start();

  machdap::test::event_recorder recorder;
  machdap::rsp::connection::config config;
  config.reply_timeout = 2000ms;
  config.poll_interval = 10ms;
  machdap::rsp::connection conn(
      config, [] { return std::make_unique<machdap::rsp::tcp_transport>(); }, recorder.sink()
  );

  conn.send(machdap::rsp::make_insert_breakpoint(0x100003f80, 4));
  conn.connect("127.0.0.1", stub.port());

  auto connected = recorder.wait_for(machdap::rsp::remote_event::kind::connected);
  REQUIRE(connected.has_value());
  REQUIRE(connected->stop.has_value());
  CHECK(connected->stop->code == 0x11);
  CHECK(connected->stop->thread_id == 0xa1ull);
  CHECK(conn.no_ack_mode());

  REQUIRE(stub.wait_received(4, 3000ms));
  auto received = stub.received();
  CHECK(received[0].rfind("qSupported", 0) == 0);
  CHECK(received[1] == "QStartNoAckMode");
  CHECK(received[2] == "?");
  CHECK(received[3] == "Z0,100003f80,4");

  std::string reply;
  REQUIRE(conn.request(machdap::rsp::make_select_thread(0xa1), reply));
  CHECK(reply == "OK");
  REQUIRE(stub.wait_received(5, 3000ms));
  CHECK(stub.received()[4] == "Hga1");

  conn.close();
}

TEST_CASE("tcp transport reports a refused loopback connect") {
  // bind then close to find a port with no listener
  int spare_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  REQUIRE(spare_fd >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t length = sizeof(addr);
  REQUIRE(::bind(spare_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  REQUIRE(::getsockname(spare_fd, reinterpret_cast<sockaddr*>(&addr), &length) == 0);
  uint16_t port = ntohs(addr.sin_port);
  ::close(spare_fd);

  machdap::rsp::tcp_transport transport(1000ms);
  std::string error;
  CHECK_FALSE(transport.connect("127.0.0.1", port, error));
  CHECK_FALSE(transport.connected());
  CHECK(error.find("connect 127.0.0.1:") == 0);
}

TEST_CASE("tcp transport gives up on an unreachable host within its deadline") {
  machdap::rsp::tcp_transport transport(200ms);
  std::string error;
  auto started = std::chrono::steady_clock::now();
  CHECK_FALSE(transport.connect("10.255.255.1", 9, error));
  CHECK(std::chrono::steady_clock::now() - started < 3s);
  CHECK_FALSE(error.empty());
}

TEST_CASE("tcp transport disconnect cancels a connect in progress") {
  machdap::rsp::tcp_transport transport(30000ms);
  std::string error;
  std::atomic<bool> connected{true};
  auto started = std::chrono::steady_clock::now();
  std::thread connecting([&] { connected = transport.connect("10.255.255.1", 9, error); });
  std::this_thread::sleep_for(100ms);
  transport.disconnect();
  connecting.join();
  CHECK_FALSE(connected);
  CHECK(std::chrono::steady_clock::now() - started < 5s);
}
