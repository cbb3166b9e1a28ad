#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "machdap/rsp/commands.hpp"
#include "machdap/rsp/stop_reply.hpp"
#include "machdap/session/session.hpp"
#include "machdap/support/dwarf_builder.hpp"
#include "machdap/support/fake_remote.hpp"

using machdap::session::session_state;
using machdap::test::sequence_spec;

namespace {

class recording_sink final : public machdap::session::message_sink {
public:
  void send(const nlohmann::json& message) override { messages.push_back(message); }

  const nlohmann::json* response_to(int64_t seq) const {
    for (const auto& message : messages) {
      if (message["type"] == "response" && message["request_seq"] == seq) {
        return &message;
      }
    }
    return nullptr;
  }

  std::vector<nlohmann::json> events(const std::string& name) const {
    std::vector<nlohmann::json> out;
    for (const auto& message : messages) {
      if (message["type"] == "event" && message["event"] == name) {
        out.push_back(message);
      }
    }
    return out;
  }

  std::vector<nlohmann::json> messages;
};

machdap::result load_app(const machdap::session::launch_config& config, machdap::symbols::symbol_store& store) {
  machdap::symbols::module_info info;
  info.path = config.program;
  info.arch = machdap::symbols::cpu_arch::arm64;
  info.text_vmaddr = 0x1000;
  auto sections = machdap::test::build_sections(
      "/src/app", {"Foo.swift"}, {sequence_spec{1, {{0x1000, 42, 0}, {0x1008, 43, 0}, {0x1010, 45, 0}}, 0x1020}},
      {{"Foo.run", 0x1000, 0x1020}}
  );
  return store.load_sections(info, sections, {});
}

machdap::result missing_app(const machdap::session::launch_config& config, machdap::symbols::symbol_store&) {
  return machdap::make_error_result(machdap::error_code::symbol_load_error, "not a file: " + config.program);
}

// owns the session under test and the fake debugserver it creates
struct harness {
  explicit harness(machdap::session::module_loader loader) {
    machdap::session::session_options options;
    options.load_module = std::move(loader);
    options.make_remote = [this](const machdap::session::launch_config&, machdap::rsp::remote_event_sink sink)
        -> std::unique_ptr<machdap::rsp::remote_target> {
      auto created = std::make_unique<machdap::test::fake_remote>(std::move(sink));
      remote = created.get();
      ++remotes_created;
      return created;
    };
    dap = std::make_unique<machdap::session::session>(std::move(options), sink);
  }

  nlohmann::json request(const std::string& command, nlohmann::json arguments = nlohmann::json::object()) {
    machdap::dap::request req;
    req.seq = ++seq;
    req.command = command;
    req.kind = machdap::dap::parse_request_kind(command);
    req.arguments = std::move(arguments);
    dap->handle_request(req);
    const nlohmann::json* response = sink.response_to(req.seq);
    REQUIRE(response != nullptr);
    return *response;
  }

  void publish(machdap::rsp::remote_event event) {
    REQUIRE(remote != nullptr);
    remote->publish(std::move(event));
    dap->drain();
  }

  void publish_stop(const std::string& body) {
    machdap::rsp::remote_event event;
    event.type = machdap::rsp::remote_event::kind::stopped;
    event.stop = machdap::rsp::parse_stop_reply(body);
    REQUIRE(event.stop.has_value());
    publish(std::move(event));
  }

  void connect(const std::string& halt_reason = "T05thread:1;") {
    machdap::rsp::remote_event event;
    event.type = machdap::rsp::remote_event::kind::connected;
    event.stop = machdap::rsp::parse_stop_reply(halt_reason);
    publish(std::move(event));
  }

  void drop(machdap::rsp::remote_event::kind kind, machdap::result error) {
    machdap::rsp::remote_event event;
    event.type = kind;
    event.error = std::move(error);
    event.text = event.error.error_message;
    publish(std::move(event));
  }

  recording_sink sink;
  std::unique_ptr<machdap::session::session> dap;
  machdap::test::fake_remote* remote = nullptr;
  int remotes_created = 0;
  int64_t seq = 0;
};

} // namespace

TEST_CASE("requests before initialize are rejected") {
  harness h(load_app);
  const auto& response = h.request("threads");
  CHECK(response["success"] == false);
  CHECK(response["message"] == "state conflict: initialize must come first");
  CHECK(h.dap->state() == session_state::uninitialized);
}

TEST_CASE("initialize advertises capabilities and unknown commands fail") {
  harness h(load_app);
  const auto& init = h.request("initialize", {{"adapterID", "machdap"}});
  CHECK(init["success"] == true);
  CHECK(init["body"]["supportsConfigurationDoneRequest"] == true);
  CHECK(h.sink.events("initialized").size() == 1);

  const auto& unknown = h.request("foo");
  CHECK(unknown["success"] == false);
  CHECK(unknown["message"] == "state conflict: Unknown command: foo");

  CHECK(h.request("initialize")["success"] == false);
}

TEST_CASE("local-only sessions survive a missing binary") {
  harness h(missing_app);
  h.request("initialize");
  const auto& launch = h.request("launch", {{"program", "/build/Missing"}});
  CHECK(launch["success"] == true);
  CHECK(h.remotes_created == 0);

  auto outputs = h.sink.events("output");
  REQUIRE_FALSE(outputs.empty());
  CHECK(outputs[0]["body"]["category"] == "important");
  CHECK(outputs[0]["body"]["output"].get<std::string>().find("/build/Missing") != std::string::npos);

  const auto& threads = h.request("threads");
  REQUIRE(threads["body"]["threads"].size() == 1);
  CHECK(threads["body"]["threads"][0]["id"] == 1);
  CHECK(threads["body"]["threads"][0]["name"] == "Thread 1");

  const auto& trace = h.request("stackTrace", {{"threadId", 1}});
  REQUIRE(trace["success"] == true);
  REQUIRE(trace["body"]["stackFrames"].size() == 1);
  CHECK(trace["body"]["stackFrames"][0]["name"] == "unknown");
  CHECK(trace["body"]["stackFrames"][0]["source"]["path"] == "<unknown>");
  CHECK(h.remotes_created == 0);
}

TEST_CASE("local-only sessions stop on entry and refuse to run") {
  harness h(load_app);
  h.request("initialize");
  REQUIRE(h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 0}})["success"] == true);
  CHECK(h.request("configurationDone")["success"] == true);

  auto stopped = h.sink.events("stopped");
  REQUIRE(stopped.size() == 1);
  CHECK(stopped[0]["body"]["reason"] == "entry");
  CHECK(stopped[0]["body"]["description"] == "Stopped on entry (no debugserver)");
  CHECK(stopped[0]["body"]["threadId"] == 1);
  CHECK(h.dap->state() == session_state::stopped);

  const auto& trace = h.request("stackTrace", {{"threadId", 1}});
  REQUIRE(trace["body"]["stackFrames"].size() == 1);
  const auto& top = trace["body"]["stackFrames"][0];
  CHECK(top["name"] == "Foo.run");
  CHECK(top["line"] == 42);
  CHECK(top["source"]["name"] == "Foo.swift");

  const auto& scopes = h.request("scopes", {{"frameId", top["id"]}});
  REQUIRE(scopes["body"]["scopes"].size() == 3);
  int64_t frame_ref = scopes["body"]["scopes"][1]["variablesReference"];
  const auto& variables = h.request("variables", {{"variablesReference", frame_ref}});
  REQUIRE(variables["success"] == true);
  CHECK(variables["body"]["variables"][1]["name"] == "function");
  CHECK(variables["body"]["variables"][1]["value"] == "Foo.run");

  const auto& pc = h.request("evaluate", {{"expression", "pc"}});
  CHECK(pc["success"] == true);
  CHECK(pc["body"]["result"] == "0x0000000000001000");

  const auto& unknown = h.request("evaluate", {{"expression", "unknownVar"}});
  CHECK(unknown["success"] == false);
  CHECK(unknown["message"].get<std::string>().find("unknownVar") != std::string::npos);

  CHECK(h.request("evaluate", {{"expression", "line"}, {"context", "watch"}})["success"] == true);
  int64_t watch_ref = scopes["body"]["scopes"][2]["variablesReference"];
  const auto& watched = h.request("variables", {{"variablesReference", watch_ref}});
  REQUIRE(watched["body"]["variables"].size() == 1);
  CHECK(watched["body"]["variables"][0]["name"] == "line");
  CHECK(watched["body"]["variables"][0]["value"] == "42");

  const auto& cont = h.request("continue", {{"threadId", 1}});
  CHECK(cont["success"] == false);
  CHECK(cont["message"].get<std::string>().find("needs a debugserver connection") != std::string::npos);
  CHECK(h.request("next", {{"threadId", 1}})["success"] == false);
  CHECK(h.remotes_created == 0);
}

TEST_CASE("breakpoints set before launch are inserted once the debugserver connects") {
  harness h(load_app);
  h.request("initialize");

  const auto& set = h.request(
      "setBreakpoints", {{"source", {{"path", "/src/app/Foo.swift"}}}, {"breakpoints", {{{"line", 42}}}}}
  );
  REQUIRE(set["body"]["breakpoints"].size() == 1);
  CHECK(set["body"]["breakpoints"][0]["verified"] == false);
  int bp_id = set["body"]["breakpoints"][0]["id"];

  REQUIRE(h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}})["success"] == true);
  REQUIRE(h.remote != nullptr);
  CHECK(h.remote->connects() == 1);
  CHECK(h.remote->port() == 1234);

  auto changed = h.sink.events("breakpoint");
  REQUIRE(changed.size() == 1);
  CHECK(changed[0]["body"]["breakpoint"]["id"] == bp_id);
  CHECK(changed[0]["body"]["breakpoint"]["verified"] == true);
  CHECK(changed[0]["body"]["breakpoint"]["instructionReference"] == "0x0000000000001000");
  CHECK(h.remote->count_sent(machdap::rsp::command_kind::insert_breakpoint) == 0);

  h.connect();
  CHECK(h.remote->sent_payloads() == std::vector<std::string>{"Z0,1000,4"});

  CHECK(h.request("configurationDone")["success"] == true);
  CHECK(h.dap->state() == session_state::running);
  CHECK(h.remote->sent_payloads().back() == "vCont;c");

  const auto& busy = h.request("continue", {{"threadId", 1}});
  CHECK(busy["success"] == false);
  CHECK(busy["message"] == "state conflict: continue requires a stopped target (state: running)");

  h.publish_stop("T05thread:1;reason:breakpoint;20:0010000000000000;");
  auto stopped = h.sink.events("stopped");
  REQUIRE(stopped.size() == 1);
  CHECK(stopped[0]["body"]["reason"] == "breakpoint");
  CHECK(stopped[0]["body"]["threadId"] == 1);
  CHECK(stopped[0]["body"]["hitBreakpointIds"] == nlohmann::json::array({bp_id}));
  CHECK(h.dap->state() == session_state::stopped);

  const auto& unknown = h.request("evaluate", {{"expression", "unknownVar"}});
  CHECK(unknown["success"] == false);
  CHECK(unknown["message"].get<std::string>().find("unknownVar") != std::string::npos);

  CHECK(h.remote->count_sent(machdap::rsp::command_kind::insert_breakpoint) == 1);
}

TEST_CASE("next steps until the source line changes") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}, {"stopOnEntry", true}});
  h.connect();
  h.request("configurationDone");

  auto entry = h.sink.events("stopped");
  REQUIRE(entry.size() == 1);
  CHECK(entry[0]["body"]["reason"] == "entry");

  h.publish_stop("T05thread:1;reason:trace;20:0010000000000000;");
  REQUIRE(h.request("next", {{"threadId", 1}})["success"] == true);
  CHECK(h.remote->sent_payloads().back() == "vCont;s:1");
  CHECK(h.dap->state() == session_state::running);

  h.publish_stop("T05thread:1;reason:trace;20:0810000000000000;");
  auto stops = h.sink.events("stopped");
  REQUIRE(stops.size() == 3);
  CHECK(stops[2]["body"]["reason"] == "step");
  CHECK(h.dap->state() == session_state::stopped);
}

TEST_CASE("a rejected breakpoint insert is reported as unverified") {
  harness h(load_app);
  h.request("initialize");
  h.request("setBreakpoints", {{"source", {{"path", "Foo.swift"}}}, {"breakpoints", {{{"line", 43}}}}});
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();

  machdap::rsp::remote_event failed;
  failed.type = machdap::rsp::remote_event::kind::command_failed;
  failed.command = machdap::rsp::command_kind::insert_breakpoint;
  failed.tag = 0x1008;
  failed.text = "E08";
  h.publish(failed);

  auto changed = h.sink.events("breakpoint");
  REQUIRE(changed.size() == 2);
  CHECK(changed[1]["body"]["breakpoint"]["verified"] == false);
  CHECK(changed[1]["body"]["breakpoint"]["message"] == "debugserver rejected breakpoint: E08");
}

TEST_CASE("process exit terminates the session") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");

  h.publish_stop("W03");
  auto exited = h.sink.events("exited");
  REQUIRE(exited.size() == 1);
  CHECK(exited[0]["body"]["exitCode"] == 3);
  CHECK(h.sink.events("terminated").size() == 1);
  CHECK(h.dap->state() == session_state::terminated);

  const auto& late = h.request("stackTrace", {{"threadId", 1}});
  CHECK(late["success"] == false);
  CHECK(late["message"] == "state conflict: session terminated");
  CHECK(h.request("threads")["body"]["threads"].empty());

  CHECK(h.request("disconnect")["success"] == true);
  CHECK(h.dap->finished());
  CHECK(h.sink.events("terminated").size() == 1);
}

TEST_CASE("disconnect ends a local session") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}});
  CHECK(h.request("disconnect", {{"terminateDebuggee", true}})["success"] == true);
  CHECK(h.dap->finished());
  CHECK(h.sink.events("terminated").size() == 1);
  CHECK(h.dap->state() == session_state::terminated);
}

TEST_CASE("the image slide reported by the debugserver moves resolved breakpoints") {
  harness h(load_app);
  h.request("initialize");
  h.request("setBreakpoints", {{"source", {{"path", "Foo.swift"}}}, {"breakpoints", {{{"line", 42}}}}});
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  REQUIRE(h.remote != nullptr);
  h.remote->set_reply(
      "jGetLoadedDynamicLibrariesInfos:{\"fetch_all_solibs\":true}",
      R"({"images":[{"load_address":1052672,"pathname":"/private/var/containers/App.app/App","uuid":""}]})"
  );
  h.connect();

  CHECK(h.dap->symbols().slide() == 0x100000);
  CHECK(h.remote->sent_payloads() == std::vector<std::string>{"Z0,101000,4"});
  auto changed = h.sink.events("breakpoint");
  REQUIRE(changed.size() == 2);
  CHECK(changed[1]["body"]["breakpoint"]["instructionReference"] == "0x0000000000101000");
  CHECK(changed[1]["body"]["breakpoint"]["line"] == 42);
}

TEST_CASE("pause interrupts a running target") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");
  REQUIRE(h.dap->state() == session_state::running);

  CHECK(h.request("pause", {{"threadId", 1}})["success"] == true);
  CHECK(h.remote->interrupts() == 1);

  h.publish_stop("T02thread:1;");
  auto stopped = h.sink.events("stopped");
  REQUIRE(stopped.size() == 1);
  CHECK(stopped[0]["body"]["reason"] == "pause");

  CHECK(h.request("pause", {{"threadId", 1}})["success"] == true);
  CHECK(h.remote->interrupts() == 1);
}

TEST_CASE("restart reconnects and resumes after the handshake") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");

  CHECK(h.request("restart")["success"] == true);
  CHECK(h.remotes_created == 2);
  CHECK(h.remote->connects() == 1);
  CHECK(h.remote->sent_payloads().empty());

  h.connect();
  CHECK(h.remote->sent_payloads() == std::vector<std::string>{"vCont;c"});
  CHECK(h.dap->state() == session_state::running);
}

TEST_CASE("stack and evaluate requests need a stopped target") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");
  REQUIRE(h.dap->state() == session_state::running);

  const auto& trace = h.request("stackTrace", {{"threadId", 1}});
  CHECK(trace["success"] == false);
  CHECK(trace["message"] == "state conflict: stackTrace requires a stopped target (state: running)");

  const auto& pc = h.request("evaluate", {{"expression", "pc"}});
  CHECK(pc["success"] == false);
  CHECK(pc["message"] == "state conflict: evaluate requires a stopped target (state: running)");
}

TEST_CASE("a reconnect while running reports the stub's halt reason") {
  harness h(load_app);
  h.request("initialize");
  h.request("setBreakpoints", {{"source", {{"path", "Foo.swift"}}}, {"breakpoints", {{{"line", 42}}}}});
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");
  REQUIRE(h.remote->sent_payloads() == std::vector<std::string>{"Z0,1000,4", "vCont;c"});

  h.drop(
      machdap::rsp::remote_event::kind::protocol_error,
      machdap::make_error_result(machdap::error_code::remote_protocol_error, "repeated checksum failures")
  );
  auto outputs = h.sink.events("output");
  REQUIRE_FALSE(outputs.empty());
  CHECK(outputs.back()["body"]["category"] == "important");
  CHECK(outputs.back()["body"]["output"] == "remote protocol error: repeated checksum failures\n");
  CHECK(h.dap->state() == session_state::running);
  CHECK(h.sink.events("stopped").empty());

  h.connect("T05thread:1;reason:breakpoint;20:0010000000000000;");
  auto stopped = h.sink.events("stopped");
  REQUIRE(stopped.size() == 1);
  CHECK(stopped[0]["body"]["reason"] == "breakpoint");
  CHECK(stopped[0]["body"]["hitBreakpointIds"].size() == 1);
  CHECK(h.dap->state() == session_state::stopped);
  CHECK(h.remote->count_sent(machdap::rsp::command_kind::insert_breakpoint) == 2);

  CHECK(h.request("continue", {{"threadId", 1}})["success"] == true);
  CHECK(h.remote->sent_payloads().back() == "vCont;c");
  CHECK(h.dap->state() == session_state::running);
}

TEST_CASE("a dropped connection while stopped reports the stop again on reconnect") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}, {"stopOnEntry", true}});
  h.connect();
  h.request("configurationDone");
  REQUIRE(h.dap->state() == session_state::stopped);

  h.drop(
      machdap::rsp::remote_event::kind::disconnected,
      machdap::make_error_result(machdap::error_code::remote_unavailable, "connection lost")
  );
  auto outputs = h.sink.events("output");
  REQUIRE_FALSE(outputs.empty());
  CHECK(outputs.back()["body"]["output"] == "debugserver connection closed: remote unavailable: connection lost\n");

  h.connect("T11thread:2;");
  auto stopped = h.sink.events("stopped");
  REQUIRE(stopped.size() == 2);
  CHECK(stopped[1]["body"]["reason"] == "signal");
  CHECK(stopped[1]["body"]["threadId"] == 2);
}

TEST_CASE("breakpoints survive process exit and are inserted again on restart") {
  harness h(load_app);
  h.request("initialize");
  h.request("setBreakpoints", {{"source", {{"path", "Foo.swift"}}}, {"breakpoints", {{{"line", 42}}}}});
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.connect();
  h.request("configurationDone");

  h.publish_stop("W00");
  REQUIRE(h.dap->state() == session_state::terminated);
  auto changed = h.sink.events("breakpoint");
  REQUIRE(changed.size() == 2);
  CHECK(changed[1]["body"]["breakpoint"]["verified"] == false);
  CHECK(changed[1]["body"]["breakpoint"]["message"] == "module not loaded");

  CHECK(h.request("restart")["success"] == true);
  CHECK(h.remotes_created == 2);
  changed = h.sink.events("breakpoint");
  REQUIRE(changed.size() == 3);
  CHECK(changed[2]["body"]["breakpoint"]["verified"] == true);
  CHECK(changed[2]["body"]["breakpoint"]["id"] == changed[0]["body"]["breakpoint"]["id"]);

  h.connect();
  CHECK(h.remote->sent_payloads() == std::vector<std::string>{"Z0,1000,4", "vCont;c"});
  CHECK(h.dap->state() == session_state::running);
}

TEST_CASE("a failed connect is reported as retryable") {
  harness h(load_app);
  h.request("initialize");
  h.request("launch", {{"program", "/build/App"}, {"debugserverPort", 1234}});
  h.drop(
      machdap::rsp::remote_event::kind::connect_failed,
      machdap::make_error_result(machdap::error_code::remote_unavailable, "connect 127.0.0.1:1234: Connection refused")
  );

  auto outputs = h.sink.events("output");
  REQUIRE_FALSE(outputs.empty());
  CHECK(outputs.back()["body"]["category"] == "important");
  CHECK(
      outputs.back()["body"]["output"] ==
      "remote unavailable: connect 127.0.0.1:1234: Connection refused (retrying on the next command)\n"
  );
  CHECK(h.dap->state() == session_state::launching);
}
