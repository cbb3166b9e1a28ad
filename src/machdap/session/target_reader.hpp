#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "machdap/base/error.hpp"
#include "machdap/rsp/remote_target.hpp"

namespace machdap::session {

// synchronous view of a stopped target
class target_reader {
public:
  virtual ~target_reader() = default;

  virtual result read_register(uint64_t thread_id, int regno, uint64_t& value) = 0;
  virtual result read_memory(uint64_t address, size_t length, std::vector<uint8_t>& out) = 0;
  virtual result thread_ids(std::vector<uint64_t>& out) = 0;
};

// target_reader over the gdb-remote connection; caches registers until the next resume
class remote_target_reader final : public target_reader {
public:
  explicit remote_target_reader(rsp::remote_target& remote) : remote_(remote) {}

  result read_register(uint64_t thread_id, int regno, uint64_t& value) override;
  result read_memory(uint64_t address, size_t length, std::vector<uint8_t>& out) override;
  result thread_ids(std::vector<uint64_t>& out) override;

  // expedited registers from a stop reply
  void seed(uint64_t thread_id, const std::vector<std::pair<int, std::string>>& registers);
  void invalidate();

private:
  result select_thread(uint64_t thread_id);

  rsp::remote_target& remote_;
  std::optional<uint64_t> selected_thread_{};
  std::map<std::pair<uint64_t, int>, uint64_t> registers_{};
  redlog::logger log_{"machdap.session.target"};
};

} // namespace machdap::session
