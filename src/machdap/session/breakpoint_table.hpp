#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "machdap/rsp/commands.hpp"
#include "machdap/symbols/symbol_store.hpp"

namespace machdap::session {

enum class breakpoint_state { pending, resolved };

enum class breakpoint_origin { source, instruction };

struct breakpoint {
  int id = 0;
  breakpoint_origin origin = breakpoint_origin::source;
  std::string source_path;
  // requested line; the resolved line may be later
  uint32_t line = 0;
  std::optional<uint32_t> resolved_line;
  std::optional<uint64_t> address;
  breakpoint_state state = breakpoint_state::pending;
  bool verified = false;
  std::string message;
};

// receives insert and remove commands; the connection queues them until it is ready
using command_sink = std::function<void(rsp::command)>;

// client breakpoints mapped onto reference counted stop sites
//
// Each resolved breakpoint holds one reference on the site at its address. A site is inserted in the stub on
// its first reference and removed with its last one, so clients may stack breakpoints on one instruction.
// Commands only flow while the table is armed; arming installs every live site.
class breakpoint_table {
public:
  breakpoint_table() = default;

  void set_sink(command_sink sink) { sink_ = std::move(sink); }
  void set_breakpoint_kind(int kind) { breakpoint_kind_ = kind; }

  void arm();
  // forgets what the stub holds without sending removes (stub gone or process exited)
  void disarm();
  bool armed() const { return armed_; }

  // single breakpoint; pending until `store` maps the line
  int add(const std::string& path, uint32_t line, const symbols::symbol_store* store);
  // no-op for pending breakpoints
  bool clear(int id);

  // replaces the breakpoints of one source, keeping ids of lines that are still requested
  std::vector<breakpoint> set_source_breakpoints(
      const std::string& path, const std::vector<uint32_t>& lines, const symbols::symbol_store* store
  );
  std::vector<breakpoint> set_instruction_breakpoints(const std::vector<uint64_t>& addresses);

  // re-resolves source breakpoints after a load or a slide change; returns those that changed
  std::vector<breakpoint> resolve(const symbols::symbol_store& store);
  // every source breakpoint goes back to pending
  std::vector<breakpoint> unresolve();

  // the stub refused the insert at `address`
  std::vector<breakpoint> mark_insert_failed(uint64_t address, const std::string& message);

  void acquire_temporary(uint64_t address);
  void release_temporary(uint64_t address);

  // removes every site and drops all breakpoints
  void release_all();

  const breakpoint* find(int id) const;
  std::vector<int> breakpoints_at(uint64_t address) const;
  std::vector<breakpoint> all() const;
  bool has_site(uint64_t address) const { return sites_.find(address) != sites_.end(); }
  size_t site_references(uint64_t address) const;
  size_t size() const { return breakpoints_.size(); }

private:
  struct site {
    size_t references = 0;
    bool inserted = false;
  };

  void resolve_one(breakpoint& bp, const symbols::symbol_store* store);
  void acquire_site(uint64_t address);
  void release_site(uint64_t address);
  void detach_site(breakpoint& bp);

  command_sink sink_{};
  int breakpoint_kind_ = 4;
  bool armed_ = false;
  int next_id_ = 1;
  std::map<int, breakpoint> breakpoints_{};
  std::map<uint64_t, site> sites_{};
  redlog::logger log_{"machdap.session.breakpoints"};
};

} // namespace machdap::session
