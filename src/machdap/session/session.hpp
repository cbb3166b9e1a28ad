#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "machdap/base/error.hpp"
#include "machdap/dap/protocol.hpp"
#include "machdap/rsp/remote_target.hpp"
#include "machdap/symbols/symbol_store.hpp"

#include "breakpoint_table.hpp"
#include "event_queue.hpp"
#include "expression.hpp"
#include "launch_config.hpp"
#include "register_layout.hpp"
#include "stack_assembler.hpp"
#include "target_reader.hpp"
#include "watch_set.hpp"

namespace machdap::session {

enum class session_state { uninitialized, initialized, launching, attaching, running, stopped, terminated };

const char* session_state_name(session_state state);

// where responses and events go; stdout in the adapter, a recorder in tests
class message_sink {
public:
  virtual ~message_sink() = default;
  virtual void send(const nlohmann::json& message) = 0;
};

using remote_factory =
    std::function<std::unique_ptr<rsp::remote_target>(const launch_config& config, rsp::remote_event_sink sink)>;
using module_loader = std::function<result(const launch_config& config, symbols::symbol_store& store)>;

struct session_options {
  // environment or file supplied configuration; request arguments override it
  launch_config defaults{};
  remote_factory make_remote{};
  module_loader load_module{};
  size_t max_step_count = 10000;
};

// gdb-remote connection over TCP with the configured reply timeout
std::unique_ptr<rsp::remote_target> make_tcp_remote(const launch_config& config, rsp::remote_event_sink sink);

// symbol_store::load with the configured dSYM and strictness
result load_module_from_disk(const launch_config& config, symbols::symbol_store& store);

// DAP session state machine
//
// The session thread is the only caller. DAP requests and remote events both arrive through the event queue;
// remote replies are never applied from the connection's reader thread.
class session {
public:
  session(session_options options, message_sink& sink);
  ~session();

  session(const session&) = delete;
  session& operator=(const session&) = delete;

  void dispatch(const session_event& event);
  void handle_request(const dap::request& req);
  void handle_remote_event(const rsp::remote_event& event);
  // generation of the live connection, for tests that publish remote events by hand
  uint64_t remote_generation() const { return remote_generation_; }

  // processes queued events without blocking
  size_t drain();
  // blocks until disconnect or end of the client stream; returns the process exit code
  int run();

  event_queue& events() { return events_; }
  session_state state() const { return state_; }
  bool finished() const { return finished_; }
  const breakpoint_table& breakpoints() const { return breakpoints_; }
  const symbols::symbol_store& symbols() const { return store_; }
  const watch_set& watches() const { return watches_; }
  const launch_config& config() const { return config_; }

private:
  enum class step_kind { over, into, out };

  struct step_plan {
    step_kind kind = step_kind::over;
    uint64_t thread_id = 0;
    std::optional<symbols::source_location> start;
    std::string start_function;
    std::optional<uint64_t> temporary;
    size_t steps = 0;
  };

  struct frame_handle {
    uint64_t thread_id = 0;
    frame_info frame;
  };

  enum class scope_kind { registers = 1, frame = 2, watch = 3 };

  // requests
  void on_initialize(const dap::request& req);
  void on_launch(const dap::request& req, bool attach);
  void on_set_breakpoints(const dap::request& req);
  void on_set_instruction_breakpoints(const dap::request& req);
  void on_configuration_done(const dap::request& req);
  void on_continue(const dap::request& req);
  void on_step(const dap::request& req, step_kind kind);
  void on_pause(const dap::request& req);
  void on_stack_trace(const dap::request& req);
  void on_scopes(const dap::request& req);
  void on_variables(const dap::request& req);
  void on_evaluate(const dap::request& req);
  void on_threads(const dap::request& req);
  void on_restart(const dap::request& req);
  void on_disconnect(const dap::request& req);

  // remote events
  void on_connected(const rsp::remote_event& event);
  void on_stopped(const rsp::stop_reply& stop);
  void on_command_failed(const rsp::remote_event& event);

  result load_module();
  result start_remote();
  void close_remote();
  void discover_slide();
  void start_execution();
  bool continue_step_plan(uint64_t thread_id, uint64_t pc, const rsp::stop_reply& stop);
  void finish_step_plan();
  void report_stop(uint64_t thread_id, const std::string& reason, const std::string& description,
                   std::vector<int> hit_breakpoints = {});
  void report_exit(const rsp::stop_reply& stop);
  void resume_target(rsp::command cmd);
  void enter_terminated();

  result require_stopped(const char* what) const;
  result require_remote(const char* what) const;
  std::optional<uint64_t> thread_argument(const dap::request& req) const;
  result frames_for(uint64_t thread_id, std::vector<frame_info>& out);
  frame_info synthetic_frame() const;
  const frame_handle* find_frame(int64_t frame_id) const;
  int64_t register_frame(uint64_t thread_id, const frame_info& frame);
  nlohmann::json variables_for(const frame_handle& handle, scope_kind kind);
  evaluation_context context_for(const frame_handle* handle);

  void respond(const dap::request& req, nlohmann::json body = nlohmann::json::object());
  void fail(const dap::request& req, const result& error);
  void emit(std::string_view name, nlohmann::json body = nlohmann::json::object());
  void output(const std::string& text, const char* category = "console");
  void emit_breakpoint_changes(const std::vector<breakpoint>& changed);
  nlohmann::json breakpoint_json(const breakpoint& bp) const;

  session_options options_{};
  message_sink& sink_;
  dap::message_builder builder_{};
  event_queue events_{};

  session_state state_ = session_state::uninitialized;
  bool finished_ = false;
  int exit_code_ = 0;
  launch_config config_{};
  bool launched_ = false;
  bool configuration_done_ = false;
  bool connected_ = false;
  bool resume_on_connect_ = false;
  bool pause_requested_ = false;
  uint64_t remote_generation_ = 0;

  symbols::symbol_store store_{};
  register_layout layout_{};
  breakpoint_table breakpoints_{};
  watch_set watches_{};
  std::unique_ptr<rsp::remote_target> remote_{};
  std::unique_ptr<remote_target_reader> reader_{};

  uint64_t stop_thread_ = 0;
  std::vector<uint64_t> threads_{};
  std::optional<step_plan> plan_{};
  std::vector<frame_handle> frames_{};

  redlog::logger log_{"machdap.session"};
};

} // namespace machdap::session
