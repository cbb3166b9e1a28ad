#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace machdap::rsp {

struct frame {
  enum class kind { ack, nack, interrupt, packet, notification };

  kind type = kind::packet;
  std::string body;
  bool valid = true;
  std::string error;
};

// incremental splitter for the inbound byte stream
class packet_reader {
public:
  void append(std::string_view bytes);
  bool next(frame& out);
  void clear();
  size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_{};
};

} // namespace machdap::rsp
