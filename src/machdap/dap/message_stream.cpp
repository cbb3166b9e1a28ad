#include "message_stream.hpp"

#include <cstdlib>

#include <redlog.hpp>

#include "machdap/base/string_utils.hpp"

namespace machdap::dap {

namespace {

auto log_stream = redlog::get_logger("machdap.dap.stream");

constexpr std::string_view k_header_end = "\r\n\r\n";
constexpr size_t k_max_body = 64 * 1024 * 1024;

bool parse_length(std::string_view text, size_t& out) {
  std::string value = util::trim_copy(text);
  if (value.empty()) {
    return false;
  }
  for (char ch : value) {
    if (ch < '0' || ch > '9') {
      return false;
    }
  }
  if (value.size() > 10) {
    return false;
  }
  out = static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
  return true;
}

} // namespace

void frame_decoder::append(std::string_view bytes) { buffer_.append(bytes.data(), bytes.size()); }

frame_decoder::status frame_decoder::next(nlohmann::json& out, result& failure) {
  if (!body_length_) {
    size_t end = buffer_.find(k_header_end);
    if (end == std::string::npos) {
      return status::need_more;
    }

    std::optional<size_t> length;
    std::string_view headers(buffer_.data(), end);
    size_t start = 0;
    while (start <= headers.size()) {
      size_t eol = headers.find("\r\n", start);
      std::string_view line = headers.substr(start, eol == std::string_view::npos ? std::string_view::npos : eol - start);
      size_t colon = line.find(':');
      if (colon != std::string_view::npos &&
          util::to_lower(util::trim_view(line.substr(0, colon))) == "content-length") {
        size_t parsed = 0;
        if (!parse_length(line.substr(colon + 1), parsed)) {
          failure = make_error_result(error_code::transport_framing, "invalid Content-Length: " + std::string(line));
          return status::error;
        }
        length = parsed;
      }
      if (eol == std::string_view::npos) {
        break;
      }
      start = eol + 2;
    }

    if (!length) {
      failure = make_error_result(error_code::transport_framing, "missing Content-Length header");
      return status::error;
    }
    if (*length > k_max_body) {
      failure = make_error_result(error_code::transport_framing, "message too large");
      return status::error;
    }
    body_length_ = length;
    header_length_ = end + k_header_end.size();
  }

  if (buffer_.size() < header_length_ + *body_length_) {
    return status::need_more;
  }

  std::string body = buffer_.substr(header_length_, *body_length_);
  buffer_.erase(0, header_length_ + *body_length_);
  body_length_.reset();
  header_length_ = 0;

  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    failure = make_error_result(error_code::transport_framing, "invalid JSON body");
    return status::error;
  }
  if (!parsed.is_object()) {
    failure = make_error_result(error_code::transport_framing, "message is not a JSON object");
    return status::error;
  }
  log_stream.ped("received", redlog::field("body", body));
  out = std::move(parsed);
  return status::message;
}

result frame_decoder::finish() const {
  if (body_length_ || !util::trim_view(buffer_).empty()) {
    return make_error_result(error_code::transport_framing, "stream ended inside a message");
  }
  return make_success_result();
}

std::string encode_frame(const nlohmann::json& message) {
  std::string body = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  frame += body;
  return frame;
}

message_writer::message_writer(std::ostream& out) : out_(out) {}

bool message_writer::write(const nlohmann::json& message) {
  std::string frame = encode_frame(message);
  std::lock_guard<std::mutex> lock(mutex_);
  log_stream.ped("sending", redlog::field("frame", frame));
  out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
  out_.flush();
  return static_cast<bool>(out_);
}

} // namespace machdap::dap
