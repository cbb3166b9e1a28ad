#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "machdap/rsp/commands.hpp"
#include "machdap/session/breakpoint_table.hpp"
#include "machdap/support/dwarf_builder.hpp"

using machdap::session::breakpoint_state;
using machdap::session::breakpoint_table;
using machdap::test::sequence_spec;

namespace {

struct recorded_commands {
  std::vector<std::string> payloads;

  machdap::session::command_sink sink() {
    return [this](machdap::rsp::command cmd) { payloads.push_back(cmd.payload); };
  }
};

void load_app(machdap::symbols::symbol_store& store) {
  machdap::symbols::module_info info;
  info.path = "/build/App";
  info.text_vmaddr = 0x1000;
  auto sections = machdap::test::build_sections(
      "/src/app", {"Foo.swift"}, {sequence_spec{1, {{0x1000, 42, 0}, {0x1008, 43, 0}, {0x1010, 45, 0}}, 0x1020}},
      {{"Foo.run", 0x1000, 0x1020}}
  );
  REQUIRE(store.load_sections(info, sections, {}));
}

} // namespace

TEST_CASE("breakpoints stay pending until symbols resolve them") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  table.arm();

  machdap::symbols::symbol_store empty;
  auto added = table.set_source_breakpoints("Foo.swift", {42}, &empty);
  REQUIRE(added.size() == 1);
  CHECK(added[0].state == breakpoint_state::pending);
  CHECK_FALSE(added[0].verified);
  CHECK(added[0].message == "module not loaded");
  CHECK(commands.payloads.empty());

  machdap::symbols::symbol_store store;
  load_app(store);
  auto changed = table.resolve(store);
  REQUIRE(changed.size() == 1);
  CHECK(changed[0].id == added[0].id);
  CHECK(changed[0].state == breakpoint_state::resolved);
  CHECK(changed[0].verified);
  CHECK(changed[0].address == 0x1000ull);
  CHECK(changed[0].resolved_line == 42u);
  CHECK(commands.payloads == std::vector<std::string>{"Z0,1000,4"});

  CHECK(table.resolve(store).empty());
  CHECK(commands.payloads.size() == 1);
}

TEST_CASE("shared sites are inserted once and removed with the last reference") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  table.arm();
  machdap::symbols::symbol_store store;
  load_app(store);

  int first = table.add("Foo.swift", 42, &store);
  int second = table.add("/src/app/Foo.swift", 42, &store);
  CHECK(first != second);
  CHECK(table.site_references(0x1000) == 2);
  CHECK(commands.payloads == std::vector<std::string>{"Z0,1000,4"});

  CHECK(table.clear(first));
  CHECK(table.has_site(0x1000));
  CHECK(commands.payloads.size() == 1);

  CHECK(table.clear(second));
  CHECK_FALSE(table.has_site(0x1000));
  CHECK(commands.payloads == std::vector<std::string>{"Z0,1000,4", "z0,1000,4"});
  CHECK_FALSE(table.clear(second));
}

TEST_CASE("replacing a source keeps ids of lines still requested") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  table.arm();
  machdap::symbols::symbol_store store;
  load_app(store);

  auto initial = table.set_source_breakpoints("Foo.swift", {42, 43}, &store);
  REQUIRE(initial.size() == 2);
  auto next = table.set_source_breakpoints("Foo.swift", {43, 45}, &store);
  REQUIRE(next.size() == 2);
  CHECK(next[0].id == initial[1].id);
  CHECK(next[1].id != initial[0].id);
  CHECK(next[1].address == 0x1010ull);
  CHECK(table.size() == 2);
  CHECK_FALSE(table.has_site(0x1000));

  auto cleared = table.set_source_breakpoints("Foo.swift", {}, &store);
  CHECK(cleared.empty());
  CHECK(table.size() == 0);
}

TEST_CASE("breakpoint commands wait until the table is armed") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  machdap::symbols::symbol_store store;
  load_app(store);

  table.add("Foo.swift", 42, &store);
  table.set_instruction_breakpoints({0x2000});
  CHECK(commands.payloads.empty());

  table.arm();
  CHECK(commands.payloads == std::vector<std::string>{"Z0,1000,4", "Z0,2000,4"});
  table.arm();
  CHECK(commands.payloads.size() == 2);

  table.disarm();
  table.arm();
  CHECK(commands.payloads.size() == 4);
}

TEST_CASE("rejected inserts unverify the breakpoints at that site") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  table.arm();
  machdap::symbols::symbol_store store;
  load_app(store);

  int id = table.add("Foo.swift", 43, &store);
  auto changed = table.mark_insert_failed(0x1008, "Z0 rejected: E08");
  REQUIRE(changed.size() == 1);
  CHECK(changed[0].id == id);
  CHECK_FALSE(changed[0].verified);
  CHECK(changed[0].message == "Z0 rejected: E08");
  CHECK(table.breakpoints_at(0x1008) == std::vector<int>{id});
}

TEST_CASE("temporary sites share references with client breakpoints") {
  recorded_commands commands;
  breakpoint_table table;
  table.set_sink(commands.sink());
  table.arm();
  machdap::symbols::symbol_store store;
  load_app(store);

  table.add("Foo.swift", 45, &store);
  table.acquire_temporary(0x1010);
  table.acquire_temporary(0x3000);
  CHECK(table.site_references(0x1010) == 2);
  table.release_temporary(0x1010);
  table.release_temporary(0x3000);
  CHECK(table.site_references(0x1010) == 1);
  CHECK(commands.payloads == std::vector<std::string>{"Z0,1010,4", "Z0,3000,4", "z0,3000,4"});

  auto pending = table.unresolve();
  REQUIRE(pending.size() == 1);
  CHECK(pending[0].state == breakpoint_state::pending);
  CHECK(commands.payloads.back() == "z0,1010,4");
}
