#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "machdap/base/error.hpp"

namespace machdap::dap {

// splits `Content-Length` framed JSON messages out of the client byte stream
class frame_decoder {
public:
  enum class status { need_more, message, error };

  void append(std::string_view bytes);

  // `message` fills `out`; `error` fills `failure` and is not recoverable
  status next(nlohmann::json& out, result& failure);

  // end of stream; a partially received frame is an error
  result finish() const;

  size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_{};
  std::optional<size_t> body_length_{};
  size_t header_length_ = 0;
};

// serializes whole frames onto an output stream
class message_writer {
public:
  explicit message_writer(std::ostream& out);

  bool write(const nlohmann::json& message);

private:
  std::ostream& out_;
  std::mutex mutex_{};
};

std::string encode_frame(const nlohmann::json& message);

} // namespace machdap::dap
