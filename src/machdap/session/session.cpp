#include "session.hpp"

#include <algorithm>
#include <chrono>

#include "machdap/base/string_utils.hpp"
#include "machdap/base/uuid_format.hpp"
#include "machdap/rsp/commands.hpp"
#include "machdap/rsp/connection.hpp"
#include "machdap/rsp/packet_codec.hpp"
#include "machdap/rsp/tcp_transport.hpp"

namespace machdap::session {

namespace {

constexpr int64_t k_scopes_per_frame = 4;
constexpr uint64_t k_local_thread_id = 1;
constexpr uint8_t k_sigtrap = 5;
constexpr uint64_t k_exc_breakpoint = 6;
constexpr std::chrono::milliseconds k_run_poll{200};

std::optional<int64_t> int_argument(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    return static_cast<int64_t>(it->get<uint64_t>());
  }
  if (it->is_number_integer()) {
    return it->get<int64_t>();
  }
  return std::nullopt;
}

std::string string_argument(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool bool_argument(const nlohmann::json& args, const char* key, bool fallback) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::string stop_description(const rsp::stop_reply& stop) {
  if (!stop.description.empty()) {
    return stop.description;
  }
  switch (stop.cause) {
  case rsp::stop_cause::breakpoint:
    return "Breakpoint hit";
  case rsp::stop_cause::step:
    return "Step completed";
  case rsp::stop_cause::watchpoint:
    return "Watchpoint hit";
  case rsp::stop_cause::exception:
    if (stop.mach_exception) {
      return "Exception " + std::to_string(*stop.mach_exception);
    }
    return "Exception";
  default:
    return "Signal " + std::to_string(stop.code);
  }
}

// single-step and breakpoint traps as debugserver reports them
bool is_trap(const rsp::stop_reply& stop) {
  switch (stop.cause) {
  case rsp::stop_cause::step:
  case rsp::stop_cause::breakpoint:
    return true;
  case rsp::stop_cause::exception:
    return stop.mach_exception == k_exc_breakpoint || stop.code == k_sigtrap;
  default:
    return stop.code == k_sigtrap;
  }
}

nlohmann::json source_json(const std::optional<symbols::source_location>& location) {
  if (!location || location->file.empty()) {
    return nlohmann::json{{"name", "<unknown>"}, {"path", "<unknown>"}};
  }
  return nlohmann::json{
      {"name", std::string(util::basename_view(location->file))},
      {"path", location->file},
  };
}

nlohmann::json variable(const std::string& name, const std::string& value) {
  return nlohmann::json{{"name", name}, {"value", value}, {"variablesReference", 0}};
}

} // namespace

const char* session_state_name(session_state state) {
  switch (state) {
  case session_state::uninitialized:
    return "uninitialized";
  case session_state::initialized:
    return "initialized";
  case session_state::launching:
    return "launching";
  case session_state::attaching:
    return "attaching";
  case session_state::running:
    return "running";
  case session_state::stopped:
    return "stopped";
  case session_state::terminated:
    return "terminated";
  default:
    return "unknown";
  }
}

std::unique_ptr<rsp::remote_target> make_tcp_remote(const launch_config& config, rsp::remote_event_sink sink) {
  rsp::connection::config settings{};
  settings.reply_timeout = std::chrono::milliseconds(config.reply_timeout_ms);
  std::chrono::milliseconds connect_timeout = settings.reply_timeout;
  return std::make_unique<rsp::connection>(
      settings,
      [connect_timeout]() -> std::unique_ptr<rsp::transport> {
        return std::make_unique<rsp::tcp_transport>(connect_timeout);
      },
      std::move(sink)
  );
}

result load_module_from_disk(const launch_config& config, symbols::symbol_store& store) {
  symbols::load_options options;
  options.program_path = config.program;
  if (!config.debug_info.empty()) {
    options.debug_info_path = config.debug_info;
  }
  options.strict = config.strict_symbols;
  return store.load(options);
}

session::session(session_options options, message_sink& sink) : options_(std::move(options)), sink_(sink) {
  if (!options_.make_remote) {
    options_.make_remote = make_tcp_remote;
  }
  if (!options_.load_module) {
    options_.load_module = load_module_from_disk;
  }
  config_ = options_.defaults;
  layout_ = build_register_layout(symbols::cpu_arch::unknown);
  breakpoints_.set_breakpoint_kind(layout_.breakpoint_kind);
}

session::~session() { close_remote(); }

void session::dispatch(const session_event& event) {
  switch (event.type) {
  case session_event::kind::request:
    handle_request(event.request);
    break;
  case session_event::kind::remote:
    if (event.generation != remote_generation_ || !remote_) {
      log_.trc("dropping event from a closed connection", redlog::field("generation", event.generation));
      break;
    }
    handle_remote_event(event.remote);
    break;
  case session_event::kind::client_closed:
    log_.inf("client stream closed");
    close_remote();
    finished_ = true;
    break;
  case session_event::kind::client_error:
    log_.err("client stream desynchronized", redlog::field("error", event.error.error_message));
    output(event.error.error_message, "important");
    emit("terminated");
    close_remote();
    state_ = session_state::terminated;
    exit_code_ = 1;
    finished_ = true;
    break;
  }
}

size_t session::drain() {
  size_t count = 0;
  session_event event;
  while (!finished_ && events_.poll(event)) {
    dispatch(event);
    ++count;
  }
  return count;
}

int session::run() {
  session_event event;
  while (!finished_) {
    if (events_.wait_pop(event, k_run_poll)) {
      dispatch(event);
    }
  }
  return exit_code_;
}

void session::handle_request(const dap::request& req) {
  log_.dbg("request", redlog::field("command", req.command), redlog::field("seq", req.seq),
           redlog::field("state", session_state_name(state_)));

  if (state_ == session_state::uninitialized && req.kind != dap::request_kind::initialize &&
      req.kind != dap::request_kind::disconnect) {
    fail(req, make_error_result(error_code::state_conflict, "initialize must come first"));
    return;
  }
  if (state_ == session_state::terminated && req.kind != dap::request_kind::disconnect &&
      req.kind != dap::request_kind::restart && req.kind != dap::request_kind::threads) {
    fail(req, make_error_result(error_code::state_conflict, "session terminated"));
    return;
  }

  switch (req.kind) {
  case dap::request_kind::initialize:
    on_initialize(req);
    break;
  case dap::request_kind::launch:
    on_launch(req, false);
    break;
  case dap::request_kind::attach:
    on_launch(req, true);
    break;
  case dap::request_kind::set_breakpoints:
    on_set_breakpoints(req);
    break;
  case dap::request_kind::set_instruction_breakpoints:
    on_set_instruction_breakpoints(req);
    break;
  case dap::request_kind::configuration_done:
    on_configuration_done(req);
    break;
  case dap::request_kind::continue_execution:
    on_continue(req);
    break;
  case dap::request_kind::next:
    on_step(req, step_kind::over);
    break;
  case dap::request_kind::step_in:
    on_step(req, step_kind::into);
    break;
  case dap::request_kind::step_out:
    on_step(req, step_kind::out);
    break;
  case dap::request_kind::pause:
    on_pause(req);
    break;
  case dap::request_kind::stack_trace:
    on_stack_trace(req);
    break;
  case dap::request_kind::scopes:
    on_scopes(req);
    break;
  case dap::request_kind::variables:
    on_variables(req);
    break;
  case dap::request_kind::evaluate:
    on_evaluate(req);
    break;
  case dap::request_kind::threads:
    on_threads(req);
    break;
  case dap::request_kind::restart:
    on_restart(req);
    break;
  case dap::request_kind::disconnect:
    on_disconnect(req);
    break;
  case dap::request_kind::unknown:
    fail(req, make_error_result(error_code::state_conflict, "Unknown command: " + req.command));
    break;
  }
}

void session::on_initialize(const dap::request& req) {
  if (state_ != session_state::uninitialized) {
    fail(req, make_error_result(error_code::state_conflict, "already initialized"));
    return;
  }
  state_ = session_state::initialized;
  respond(req, dap::make_capabilities());
  emit("initialized");
}

void session::on_launch(const dap::request& req, bool attach) {
  if (state_ != session_state::initialized) {
    fail(req, make_error_result(
                  error_code::state_conflict, std::string(attach ? "attach" : "launch") + " is not valid while " +
                                                  session_state_name(state_)
              ));
    return;
  }

  launch_config merged = options_.defaults;
  if (auto status = merge_launch_config(req.arguments, merged); !status) {
    fail(req, status);
    return;
  }
  if (auto status = validate_launch_config(merged); !status) {
    fail(req, status);
    return;
  }
  config_ = std::move(merged);
  log_.inf("starting session", redlog::field("program", config_.program),
           redlog::field("port", config_.debugserver_port), redlog::field("attach", attach));

  if (auto status = load_module(); !status) {
    fail(req, status);
    return;
  }

  launched_ = true;
  state_ = attach ? session_state::attaching : session_state::launching;
  if (!config_.local_only()) {
    if (auto status = start_remote(); !status) {
      launched_ = false;
      state_ = session_state::initialized;
      fail(req, status);
      return;
    }
  }

  respond(req, nlohmann::json{
                   {"program", config_.program},
                   {"cwd", config_.cwd},
                   {"debugserverPort", config_.debugserver_port},
               });
}

result session::load_module() {
  result status = options_.load_module(config_, store_);
  if (!status) {
    if (!(config_.local_only() && status.code == error_code::symbol_load_error)) {
      return status;
    }
    // a local-only session is still useful for the harness without symbols
    log_.wrn("continuing without symbols", redlog::field("error", status.error_message));
    output(status.error_message, "important");
    store_.reset();
  }
  for (const auto& diagnostic : store_.diagnostics()) {
    output(diagnostic.error_message);
  }

  layout_ = build_register_layout(store_.module().arch);
  breakpoints_.set_breakpoint_kind(layout_.breakpoint_kind);
  emit_breakpoint_changes(breakpoints_.resolve(store_));
  return make_success_result();
}

result session::start_remote() {
  uint64_t generation = ++remote_generation_;
  remote_ = options_.make_remote(config_, [this, generation](rsp::remote_event event) {
    events_.push(session_event::from_remote(std::move(event), generation));
  });
  if (!remote_) {
    return make_error_result(error_code::remote_unavailable, "no transport for debugserver");
  }
  reader_ = std::make_unique<remote_target_reader>(*remote_);
  breakpoints_.set_sink([this](rsp::command cmd) {
    if (remote_) {
      remote_->send(std::move(cmd));
    }
  });
  connected_ = false;
  log_.inf("connecting to debugserver", redlog::field("host", config_.debugserver_host),
           redlog::field("port", config_.debugserver_port));
  remote_->connect(config_.debugserver_host, config_.debugserver_port);
  return make_success_result();
}

void session::close_remote() {
  if (!remote_) {
    return;
  }
  breakpoints_.disarm();
  breakpoints_.set_sink({});
  reader_.reset();
  remote_->close();
  remote_.reset();
  connected_ = false;
  ++remote_generation_;
}

void session::discover_slide() {
  if (!store_.loaded() || !remote_) {
    return;
  }
  std::string reply;
  if (auto status = remote_->request(rsp::make_loaded_libraries(), reply); !status) {
    log_.dbg("library list unavailable", redlog::field("error", status.error_message));
    return;
  }
  nlohmann::json info = nlohmann::json::parse(reply, nullptr, false);
  if (info.is_discarded() || !info.is_object()) {
    log_.dbg("stub does not report libraries", redlog::field("reply", reply));
    return;
  }
  auto images = info.find("images");
  if (images == info.end() || !images->is_array()) {
    return;
  }

  const std::string want_uuid = util::normalize_uuid(store_.module().uuid);
  const std::string_view want_name = util::basename_view(config_.program);
  for (const auto& image : *images) {
    if (!image.is_object()) {
      continue;
    }
    auto load_address = int_argument(image, "load_address");
    if (!load_address) {
      continue;
    }
    std::string uuid = util::normalize_uuid(string_argument(image, "uuid"));
    std::string path = string_argument(image, "pathname");
    bool same_uuid = !want_uuid.empty() && uuid == want_uuid;
    bool same_name = want_uuid.empty() && !path.empty() && util::basename_view(path) == want_name;
    if (same_uuid || same_name) {
      store_.set_slide_from_load_address(static_cast<uint64_t>(*load_address));
      log_.inf("image slide", redlog::field("path", path), redlog::field("slide", "0x%llx", store_.slide()));
      return;
    }
  }
  log_.wrn("image not found in library list", redlog::field("program", config_.program));
}

void session::on_connected(const rsp::remote_event& event) {
  connected_ = true;
  if (event.stop && event.stop->thread_id) {
    stop_thread_ = *event.stop->thread_id;
  }
  output("connected to debugserver at " + config_.debugserver_host + ":" + std::to_string(config_.debugserver_port));

  discover_slide();
  emit_breakpoint_changes(breakpoints_.resolve(store_));
  breakpoints_.arm();

  bool starting = state_ == session_state::launching || state_ == session_state::attaching;
  if (starting) {
    if (configuration_done_ || resume_on_connect_) {
      resume_on_connect_ = false;
      start_execution();
    }
    return;
  }
  // reconnected after a drop; the halt reason replaces whatever the session last saw
  if (event.stop && (state_ == session_state::running || state_ == session_state::stopped)) {
    on_stopped(*event.stop);
  }
}

void session::start_execution() {
  uint64_t thread = stop_thread_ != 0 ? stop_thread_ : k_local_thread_id;
  if (config_.stop_on_entry) {
    report_stop(thread, "entry", "Stopped on entry");
    return;
  }
  resume_target(rsp::make_resume());
}

void session::resume_target(rsp::command cmd) {
  frames_.clear();
  if (reader_) {
    reader_->invalidate();
  }
  state_ = session_state::running;
  remote_->send(std::move(cmd));
}

void session::report_stop(
    uint64_t thread_id, const std::string& reason, const std::string& description, std::vector<int> hit_breakpoints
) {
  state_ = session_state::stopped;
  stop_thread_ = thread_id;
  frames_.clear();
  pause_requested_ = false;

  nlohmann::json body{
      {"reason", reason},
      {"description", description},
      {"threadId", thread_id},
      {"allThreadsStopped", true},
  };
  if (!hit_breakpoints.empty()) {
    body["hitBreakpointIds"] = hit_breakpoints;
  }
  log_.vrb("stopped", redlog::field("thread", thread_id), redlog::field("reason", reason));
  emit("stopped", std::move(body));
}

void session::report_exit(const rsp::stop_reply& stop) {
  int exit_code = stop.kind == rsp::stop_kind::exited ? stop.code : 128 + stop.code;
  if (stop.kind == rsp::stop_kind::exited) {
    output("process exited with status " + std::to_string(stop.code));
  } else {
    output("process terminated by signal " + std::to_string(stop.code));
  }
  emit("exited", nlohmann::json{{"exitCode", exit_code}});
  enter_terminated();
}

void session::enter_terminated() {
  if (plan_) {
    if (plan_->temporary) {
      breakpoints_.release_temporary(*plan_->temporary);
    }
    plan_.reset();
  }
  // client breakpoints stay registered so restart can resolve them again
  breakpoints_.disarm();
  emit_breakpoint_changes(breakpoints_.unresolve());
  close_remote();
  store_.reset();
  frames_.clear();
  state_ = session_state::terminated;
  emit("terminated");
}

void session::on_stopped(const rsp::stop_reply& stop) {
  if (stop.kind != rsp::stop_kind::signal) {
    report_exit(stop);
    return;
  }

  uint64_t thread = stop.thread_id.value_or(stop_thread_ != 0 ? stop_thread_ : k_local_thread_id);
  if (reader_) {
    reader_->invalidate();
    reader_->seed(thread, stop.registers);
  }
  if (!stop.threads.empty()) {
    threads_ = stop.threads;
  }

  uint64_t pc = 0;
  bool have_pc = reader_ && reader_->read_register(thread, layout_.pc_reg_num, pc).success();
  if (plan_ && have_pc && continue_step_plan(thread, pc, stop)) {
    return;
  }
  if (plan_) {
    if (plan_->temporary) {
      breakpoints_.release_temporary(*plan_->temporary);
    }
    plan_.reset();
  }

  std::vector<int> hits = have_pc ? breakpoints_.breakpoints_at(pc) : std::vector<int>{};
  std::string reason;
  if (pause_requested_) {
    reason = "pause";
  } else if (!hits.empty() || stop.cause == rsp::stop_cause::breakpoint) {
    reason = "breakpoint";
  } else {
    switch (stop.cause) {
    case rsp::stop_cause::step:
      reason = "step";
      break;
    case rsp::stop_cause::exception:
      reason = "exception";
      break;
    case rsp::stop_cause::watchpoint:
      reason = "data breakpoint";
      break;
    default:
      reason = "signal";
      break;
    }
  }
  report_stop(thread, reason, stop_description(stop), std::move(hits));
}

bool session::continue_step_plan(uint64_t thread_id, uint64_t pc, const rsp::stop_reply& stop) {
  step_plan& plan = *plan_;
  if (thread_id != plan.thread_id || !is_trap(stop) || pause_requested_) {
    return false;
  }

  if (plan.temporary) {
    if (pc != *plan.temporary) {
      // something else stopped us first
      return false;
    }
    breakpoints_.release_temporary(*plan.temporary);
    plan.temporary.reset();
    if (plan.kind == step_kind::out) {
      finish_step_plan();
      return true;
    }
  } else if (stop.cause == rsp::stop_cause::breakpoint && !breakpoints_.breakpoints_at(pc).empty()) {
    return false;
  }

  if (++plan.steps >= options_.max_step_count) {
    log_.wrn("step limit reached", redlog::field("steps", plan.steps));
    finish_step_plan();
    return true;
  }
  if (!plan.start) {
    finish_step_plan();
    return true;
  }

  auto location = store_.resolve_address(pc);
  std::string function;
  if (location && !location->function.empty()) {
    function = location->function;
  } else if (auto name = store_.resolve_function(pc)) {
    function = *name;
  }

  if (function != plan.start_function) {
    // a callee was entered when its return address points back into the starting function
    stack_assembler assembler(layout_, &store_);
    uint64_t return_pc = 0;
    bool entered_call = false;
    if (assembler.return_address(*reader_, thread_id, return_pc) && return_pc != 0) {
      auto caller = store_.resolve_function(return_pc - 1);
      entered_call = caller && *caller == plan.start_function;
    }
    if (entered_call && (plan.kind == step_kind::over || !location)) {
      plan.temporary = return_pc;
      breakpoints_.acquire_temporary(return_pc);
      resume_target(rsp::make_resume());
      return true;
    }
    finish_step_plan();
    return true;
  }

  if (location && (location->line != plan.start->line || location->file != plan.start->file)) {
    finish_step_plan();
    return true;
  }

  resume_target(rsp::make_step(thread_id));
  return true;
}

void session::finish_step_plan() {
  uint64_t thread = plan_->thread_id;
  plan_.reset();
  report_stop(thread, "step", "Step completed");
}

void session::on_command_failed(const rsp::remote_event& event) {
  std::string detail = event.text.empty() ? event.error.error_message : event.text;
  switch (event.command) {
  case rsp::command_kind::insert_breakpoint:
    emit_breakpoint_changes(breakpoints_.mark_insert_failed(event.tag, "debugserver rejected breakpoint: " + detail));
    return;
  case rsp::command_kind::remove_breakpoint:
    log_.dbg("breakpoint removal failed", redlog::field("address", "0x%016llx", event.tag));
    return;
  case rsp::command_kind::resume:
  case rsp::command_kind::step:
    if (plan_) {
      if (plan_->temporary) {
        breakpoints_.release_temporary(*plan_->temporary);
      }
      plan_.reset();
    }
    output(std::string(rsp::command_kind_name(event.command)) + " failed: " + detail, "important");
    report_stop(stop_thread_ != 0 ? stop_thread_ : k_local_thread_id, "exception", "debugserver refused to resume");
    return;
  default:
    output(std::string(rsp::command_kind_name(event.command)) + " failed: " + detail);
    return;
  }
}

void session::handle_remote_event(const rsp::remote_event& event) {
  switch (event.type) {
  case rsp::remote_event::kind::connected:
    on_connected(event);
    break;
  case rsp::remote_event::kind::connect_failed:
    connected_ = false;
    log_.wrn("debugserver unavailable", redlog::field("error", event.error.error_message));
    output(is_recoverable_error(event.error.code) ? event.error.error_message + " (retrying on the next command)"
                                                  : event.error.error_message,
           "important");
    break;
  case rsp::remote_event::kind::stopped:
    if (event.stop) {
      on_stopped(*event.stop);
    }
    break;
  case rsp::remote_event::kind::output:
    output(event.text, "stdout");
    break;
  case rsp::remote_event::kind::command_failed:
    on_command_failed(event);
    break;
  case rsp::remote_event::kind::protocol_error:
    connected_ = false;
    breakpoints_.disarm();
    log_.err("debugserver protocol error", redlog::field("error", event.error.error_message));
    output(event.error.error_message, "important");
    break;
  case rsp::remote_event::kind::disconnected:
    connected_ = false;
    breakpoints_.disarm();
    output("debugserver connection closed: " + event.error.error_message, "important");
    break;
  case rsp::remote_event::kind::warning:
    output(event.error.error_message);
    break;
  }
}

void session::on_set_breakpoints(const dap::request& req) {
  std::string path;
  auto source = req.arguments.find("source");
  if (source != req.arguments.end() && source->is_object()) {
    path = string_argument(*source, "path");
  }
  if (path.empty()) {
    fail(req, make_error_result(error_code::invalid_argument, "source.path missing"));
    return;
  }

  std::vector<uint32_t> lines;
  auto requested = req.arguments.find("breakpoints");
  if (requested != req.arguments.end() && requested->is_array()) {
    for (const auto& entry : *requested) {
      auto line = entry.is_object() ? int_argument(entry, "line") : std::nullopt;
      lines.push_back(line && *line > 0 ? static_cast<uint32_t>(*line) : 0);
    }
  } else if (auto legacy = req.arguments.find("lines"); legacy != req.arguments.end() && legacy->is_array()) {
    for (const auto& entry : *legacy) {
      lines.push_back(entry.is_number_integer() && entry.get<int64_t>() > 0 ? entry.get<uint32_t>() : 0);
    }
  }

  auto updated = breakpoints_.set_source_breakpoints(path, lines, store_.loaded() ? &store_ : nullptr);
  nlohmann::json body = nlohmann::json::array();
  for (const auto& bp : updated) {
    body.push_back(breakpoint_json(bp));
  }
  respond(req, nlohmann::json{{"breakpoints", std::move(body)}});
}

void session::on_set_instruction_breakpoints(const dap::request& req) {
  std::vector<uint64_t> addresses;
  auto requested = req.arguments.find("breakpoints");
  if (requested != req.arguments.end() && requested->is_array()) {
    for (const auto& entry : *requested) {
      std::string reference = entry.is_object() ? string_argument(entry, "instructionReference") : std::string{};
      std::string_view digits(reference);
      if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
      }
      auto address = rsp::parse_hex_u64(digits);
      if (!address) {
        fail(req, make_error_result(error_code::invalid_argument, "bad instructionReference: " + reference));
        return;
      }
      int64_t offset = int_argument(entry, "offset").value_or(0);
      addresses.push_back(*address + static_cast<uint64_t>(offset));
    }
  }

  auto updated = breakpoints_.set_instruction_breakpoints(addresses);
  nlohmann::json body = nlohmann::json::array();
  for (const auto& bp : updated) {
    body.push_back(breakpoint_json(bp));
  }
  respond(req, nlohmann::json{{"breakpoints", std::move(body)}});
}

void session::on_configuration_done(const dap::request& req) {
  configuration_done_ = true;
  respond(req);
  if (!launched_) {
    return;
  }
  if (config_.local_only()) {
    report_stop(k_local_thread_id, "entry", "Stopped on entry (no debugserver)");
    return;
  }
  bool starting = state_ == session_state::launching || state_ == session_state::attaching;
  if (!starting || !remote_) {
    return;
  }
  if (connected_) {
    start_execution();
  } else if (remote_->state() == rsp::connection_state::disconnected) {
    remote_->connect(config_.debugserver_host, config_.debugserver_port);
  }
}

result session::require_remote(const char* what) const {
  if (config_.local_only() || !remote_) {
    return make_error_result(error_code::state_conflict, std::string(what) + " needs a debugserver connection");
  }
  return make_success_result();
}

result session::require_stopped(const char* what) const {
  if (state_ != session_state::stopped) {
    return make_error_result(
        error_code::state_conflict, std::string(what) + " requires a stopped target (state: " +
                                        session_state_name(state_) + ")"
    );
  }
  return make_success_result();
}

std::optional<uint64_t> session::thread_argument(const dap::request& req) const {
  auto thread = int_argument(req.arguments, "threadId");
  if (!thread || *thread <= 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(*thread);
}

void session::on_continue(const dap::request& req) {
  if (auto status = require_remote("continue"); !status) {
    fail(req, status);
    return;
  }
  if (auto status = require_stopped("continue"); !status) {
    fail(req, status);
    return;
  }
  if (plan_) {
    if (plan_->temporary) {
      breakpoints_.release_temporary(*plan_->temporary);
    }
    plan_.reset();
  }
  resume_target(rsp::make_resume());
  respond(req, nlohmann::json{{"allThreadsContinued", true}});
}

void session::on_step(const dap::request& req, step_kind kind) {
  if (auto status = require_remote(req.command.c_str()); !status) {
    fail(req, status);
    return;
  }
  if (auto status = require_stopped(req.command.c_str()); !status) {
    fail(req, status);
    return;
  }

  step_plan plan;
  plan.kind = kind;
  plan.thread_id = thread_argument(req).value_or(stop_thread_);
  uint64_t pc = 0;
  if (auto status = reader_->read_register(plan.thread_id, layout_.pc_reg_num, pc); !status) {
    fail(req, status);
    return;
  }
  plan.start = store_.resolve_address(pc);
  if (plan.start && !plan.start->function.empty()) {
    plan.start_function = plan.start->function;
  } else if (auto name = store_.resolve_function(pc)) {
    plan.start_function = *name;
  }

  if (kind == step_kind::out) {
    std::vector<frame_info> frames;
    stack_assembler assembler(layout_, &store_);
    if (auto status = assembler.backtrace(*reader_, plan.thread_id, frames, 2); !status) {
      fail(req, status);
      return;
    }
    if (frames.size() < 2) {
      fail(req, make_error_result(error_code::state_conflict, "no caller frame to return to"));
      return;
    }
    plan.temporary = frames[1].pc;
    breakpoints_.acquire_temporary(frames[1].pc);
    plan_ = std::move(plan);
    resume_target(rsp::make_resume());
    respond(req);
    return;
  }

  uint64_t thread = plan.thread_id;
  plan_ = std::move(plan);
  resume_target(rsp::make_step(thread));
  respond(req);
}

void session::on_pause(const dap::request& req) {
  if (auto status = require_remote("pause"); !status) {
    fail(req, status);
    return;
  }
  if (state_ != session_state::running) {
    respond(req);
    return;
  }
  pause_requested_ = true;
  if (auto status = remote_->interrupt(); !status) {
    pause_requested_ = false;
    fail(req, status);
    return;
  }
  respond(req);
}

frame_info session::synthetic_frame() const {
  frame_info frame;
  frame.index = 0;
  if (store_.loaded()) {
    frame.pc = store_.module().text_vmaddr + static_cast<uint64_t>(store_.slide());
  }
  stack_assembler assembler(layout_, &store_);
  assembler.symbolicate(frame);
  return frame;
}

result session::frames_for(uint64_t thread_id, std::vector<frame_info>& out) {
  stack_assembler assembler(layout_, &store_);
  return assembler.backtrace(*reader_, thread_id, out);
}

int64_t session::register_frame(uint64_t thread_id, const frame_info& frame) {
  for (size_t i = 0; i < frames_.size(); ++i) {
    if (frames_[i].thread_id == thread_id && frames_[i].frame.index == frame.index) {
      frames_[i].frame = frame;
      return static_cast<int64_t>(i + 1);
    }
  }
  frames_.push_back(frame_handle{thread_id, frame});
  return static_cast<int64_t>(frames_.size());
}

const session::frame_handle* session::find_frame(int64_t frame_id) const {
  if (frame_id <= 0 || static_cast<size_t>(frame_id) > frames_.size()) {
    return nullptr;
  }
  return &frames_[static_cast<size_t>(frame_id - 1)];
}

void session::on_stack_trace(const dap::request& req) {
  std::vector<frame_info> frames;
  uint64_t thread = thread_argument(req).value_or(stop_thread_ != 0 ? stop_thread_ : k_local_thread_id);

  if (config_.local_only() || !remote_) {
    if (launched_) {
      frames.push_back(synthetic_frame());
    }
  } else {
    if (auto status = require_stopped("stackTrace"); !status) {
      fail(req, status);
      return;
    }
    if (auto status = frames_for(thread, frames); !status) {
      fail(req, status);
      return;
    }
  }

  size_t start = static_cast<size_t>(std::max<int64_t>(0, int_argument(req.arguments, "startFrame").value_or(0)));
  int64_t levels = int_argument(req.arguments, "levels").value_or(0);
  size_t end = frames.size();
  if (levels > 0) {
    end = std::min(end, start + static_cast<size_t>(levels));
  }

  nlohmann::json stack = nlohmann::json::array();
  for (size_t i = start; i < end; ++i) {
    const frame_info& frame = frames[i];
    int64_t id = register_frame(thread, frame);
    stack.push_back(nlohmann::json{
        {"id", id},
        {"name", frame.function},
        {"line", frame.location ? frame.location->line : 0},
        {"column", frame.location ? std::max<uint32_t>(frame.location->column, 1) : 0},
        {"source", source_json(frame.location)},
        {"instructionPointerReference", format_address(frame.pc)},
        {"presentationHint", frame.index == 0 ? "normal" : "subtle"},
    });
  }
  respond(req, nlohmann::json{{"stackFrames", std::move(stack)}, {"totalFrames", frames.size()}});
}

void session::on_scopes(const dap::request& req) {
  auto frame_id = int_argument(req.arguments, "frameId");
  if (!frame_id || !find_frame(*frame_id)) {
    fail(req, make_error_result(error_code::invalid_argument, "unknown frameId"));
    return;
  }
  int64_t base = *frame_id * k_scopes_per_frame;
  nlohmann::json scopes = nlohmann::json::array({
      {{"name", "Registers"},
       {"presentationHint", "registers"},
       {"variablesReference", base + static_cast<int64_t>(scope_kind::registers)},
       {"expensive", false}},
      {{"name", "Frame"},
       {"presentationHint", "locals"},
       {"variablesReference", base + static_cast<int64_t>(scope_kind::frame)},
       {"expensive", false}},
      {{"name", "Watch"},
       {"variablesReference", base + static_cast<int64_t>(scope_kind::watch)},
       {"expensive", false}},
  });
  respond(req, nlohmann::json{{"scopes", std::move(scopes)}});
}

evaluation_context session::context_for(const frame_handle* handle) {
  evaluation_context context;
  context.thread_id = handle ? handle->thread_id : stop_thread_;
  context.frame = handle ? &handle->frame : nullptr;
  context.layout = &layout_;
  context.reader = !config_.local_only() && reader_ ? reader_.get() : nullptr;
  return context;
}

nlohmann::json session::variables_for(const frame_handle& handle, scope_kind kind) {
  nlohmann::json out = nlohmann::json::array();
  const frame_info& frame = handle.frame;

  switch (kind) {
  case scope_kind::registers:
    if (frame.index == 0 && reader_ && !config_.local_only()) {
      for (const auto& reg : layout_.registers) {
        uint64_t value = 0;
        if (reader_->read_register(handle.thread_id, reg.regno, value)) {
          out.push_back(variable(reg.name, format_address(value)));
        } else {
          out.push_back(variable(reg.name, "<unavailable>"));
        }
      }
      break;
    }
    if (const auto* pc = layout_.find(layout_.pc_reg_num)) {
      out.push_back(variable(pc->name, format_address(frame.pc)));
    }
    if (!config_.local_only()) {
      if (const auto* fp = layout_.find(layout_.fp_reg_num)) {
        out.push_back(variable(fp->name, format_address(frame.fp)));
      }
      if (const auto* sp = layout_.find(layout_.sp_reg_num)) {
        out.push_back(variable(sp->name, format_address(frame.sp)));
      }
    }
    break;
  case scope_kind::frame:
    out.push_back(variable("pc", format_address(frame.pc)));
    out.push_back(variable("function", frame.function));
    out.push_back(variable("file", frame.location ? frame.location->file : std::string("<unknown>")));
    out.push_back(variable("line", std::to_string(frame.location ? frame.location->line : 0)));
    if (store_.loaded()) {
      out.push_back(variable("module", std::string(util::basename_view(store_.module().path))));
    }
    break;
  case scope_kind::watch: {
    evaluation_context context = context_for(&handle);
    for (const auto& [name, expression] : watches_.all()) {
      std::string value;
      if (auto status = evaluate_expression(expression, context, value); !status) {
        value = status.error_message;
      }
      out.push_back(variable(name, value));
    }
    break;
  }
  }
  return out;
}

void session::on_variables(const dap::request& req) {
  auto reference = int_argument(req.arguments, "variablesReference");
  if (!reference || *reference <= 0) {
    fail(req, make_error_result(error_code::invalid_argument, "unknown variablesReference"));
    return;
  }
  int64_t scope = *reference % k_scopes_per_frame;
  const frame_handle* handle = find_frame(*reference / k_scopes_per_frame);
  if (!handle || scope == 0) {
    fail(req, make_error_result(error_code::invalid_argument, "unknown variablesReference"));
    return;
  }
  respond(req, nlohmann::json{{"variables", variables_for(*handle, static_cast<scope_kind>(scope))}});
}

void session::on_evaluate(const dap::request& req) {
  std::string expression = string_argument(req.arguments, "expression");
  if (expression.empty()) {
    fail(req, make_error_result(error_code::invalid_argument, "expression is required"));
    return;
  }
  if (auto status = require_stopped("evaluate"); !status) {
    fail(req, status);
    return;
  }

  const frame_handle* handle = nullptr;
  if (auto frame_id = int_argument(req.arguments, "frameId")) {
    handle = find_frame(*frame_id);
    if (!handle) {
      fail(req, make_error_result(error_code::invalid_argument, "unknown frameId"));
      return;
    }
  } else {
    frame_info top;
    if (config_.local_only() || !reader_) {
      top = synthetic_frame();
    } else {
      std::vector<frame_info> frames;
      stack_assembler assembler(layout_, &store_);
      if (auto status = assembler.backtrace(*reader_, stop_thread_, frames, 1); !status) {
        fail(req, status);
        return;
      }
      top = frames.front();
    }
    handle = find_frame(register_frame(stop_thread_, top));
  }

  if (string_argument(req.arguments, "context") == "watch") {
    watches_.set(expression, expression);
  }

  std::string value;
  if (auto status = evaluate_expression(expression, context_for(handle), value); !status) {
    fail(req, status);
    return;
  }
  respond(req, nlohmann::json{{"result", value}, {"variablesReference", 0}});
}

void session::on_threads(const dap::request& req) {
  nlohmann::json threads = nlohmann::json::array();
  if (launched_ && config_.local_only() && state_ != session_state::terminated) {
    threads.push_back(nlohmann::json{{"id", k_local_thread_id}, {"name", "Thread 1"}});
  } else if (launched_ && remote_) {
    if (state_ == session_state::stopped && reader_) {
      std::vector<uint64_t> ids;
      if (auto status = reader_->thread_ids(ids); status && !ids.empty()) {
        threads_ = std::move(ids);
      }
    }
    std::vector<uint64_t> ids = threads_;
    if (ids.empty() && stop_thread_ != 0) {
      ids.push_back(stop_thread_);
    }
    for (uint64_t id : ids) {
      threads.push_back(nlohmann::json{{"id", id}, {"name", "Thread " + std::to_string(id)}});
    }
  }
  respond(req, nlohmann::json{{"threads", std::move(threads)}});
}

void session::on_restart(const dap::request& req) {
  if (!launched_) {
    fail(req, make_error_result(error_code::state_conflict, "restart before launch"));
    return;
  }
  auto arguments = req.arguments.find("arguments");
  if (arguments != req.arguments.end() && arguments->is_object()) {
    launch_config updated = config_;
    if (auto status = merge_launch_config(*arguments, updated); !status) {
      fail(req, status);
      return;
    }
    config_ = std::move(updated);
  }

  if (plan_) {
    if (plan_->temporary) {
      breakpoints_.release_temporary(*plan_->temporary);
    }
    plan_.reset();
  }
  close_remote();
  frames_.clear();
  threads_.clear();
  stop_thread_ = 0;

  if (auto status = load_module(); !status) {
    fail(req, status);
    return;
  }
  state_ = session_state::launching;

  if (config_.local_only()) {
    respond(req);
    report_stop(k_local_thread_id, "entry", "Stopped on entry (no debugserver)");
    return;
  }
  resume_on_connect_ = true;
  if (auto status = start_remote(); !status) {
    fail(req, status);
    return;
  }
  respond(req);
}

void session::on_disconnect(const dap::request& req) {
  bool terminate = bool_argument(req.arguments, "terminateDebuggee", false);
  if (plan_) {
    if (plan_->temporary) {
      breakpoints_.release_temporary(*plan_->temporary);
    }
    plan_.reset();
  }

  if (remote_ && connected_ && remote_->state() == rsp::connection_state::ready) {
    breakpoints_.release_all();
    if (terminate) {
      remote_->send(rsp::make_kill());
    } else {
      std::string reply;
      if (auto status = remote_->request(rsp::make_detach(), reply); !status) {
        log_.wrn("detach failed", redlog::field("error", status.error_message));
      }
    }
  } else {
    breakpoints_.release_all();
  }
  close_remote();
  store_.reset();
  watches_.clear();
  frames_.clear();

  respond(req);
  if (state_ != session_state::terminated) {
    emit("terminated");
  }
  state_ = session_state::terminated;
  finished_ = true;
}

void session::respond(const dap::request& req, nlohmann::json body) {
  sink_.send(builder_.response(req, std::move(body)));
}

void session::fail(const dap::request& req, const result& error) {
  if (is_fatal_error(error.code)) {
    log_.err("request failed", redlog::field("command", req.command), redlog::field("error", error.error_message));
  } else {
    log_.dbg("request failed", redlog::field("command", req.command), redlog::field("error", error.error_message));
  }
  sink_.send(builder_.error_response(req, error.error_message));
}

void session::emit(std::string_view name, nlohmann::json body) { sink_.send(builder_.event(name, std::move(body))); }

void session::output(const std::string& text, const char* category) {
  std::string line = text;
  if (line.empty() || line.back() != '\n') {
    line.push_back('\n');
  }
  emit("output", nlohmann::json{{"category", category}, {"output", line}});
}

void session::emit_breakpoint_changes(const std::vector<breakpoint>& changed) {
  for (const auto& bp : changed) {
    emit("breakpoint", nlohmann::json{{"reason", "changed"}, {"breakpoint", breakpoint_json(bp)}});
  }
}

nlohmann::json session::breakpoint_json(const breakpoint& bp) const {
  nlohmann::json out{{"id", bp.id}, {"verified", bp.verified}};
  if (bp.origin == breakpoint_origin::source) {
    out["source"] = nlohmann::json{
        {"name", std::string(util::basename_view(bp.source_path))},
        {"path", bp.source_path},
    };
    out["line"] = bp.resolved_line.value_or(bp.line);
  }
  if (bp.address) {
    out["instructionReference"] = format_address(*bp.address);
  }
  if (!bp.message.empty()) {
    out["message"] = bp.message;
  }
  return out;
}

} // namespace machdap::session
