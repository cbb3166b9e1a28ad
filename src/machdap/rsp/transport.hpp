#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace machdap::rsp {

// byte stream to a gdb-remote stub
//
// read()/readable() are called from the connection's reader thread, write() from whichever thread holds the
// connection lock. disconnect() may be called from any thread and must wake a blocked reader.
class transport {
public:
  virtual ~transport() = default;

  virtual bool connect(const std::string& host, uint16_t port, std::string& error) = 0;
  virtual bool connected() const = 0;
  virtual bool readable(std::chrono::milliseconds timeout) = 0;
  // bytes read, 0 on orderly close, negative on error
  virtual long read(std::span<std::byte> out) = 0;
  virtual bool write(std::span<const std::byte> data) = 0;
  virtual void disconnect() = 0;
  virtual void close() = 0;
};

} // namespace machdap::rsp
