#include <doctest/doctest.h>

#include <cstdlib>
#include <string>

#include <nlohmann/json.hpp>

#include "machdap/session/launch_config.hpp"

using machdap::session::launch_config;

TEST_CASE("launch arguments overlay the base configuration") {
  launch_config config;
  config.debug_info = "/base/App.dSYM";
  auto args = nlohmann::json::parse(
      R"({"program":"/build/App","debugserverPort":"1234","stopOnEntry":true,"replyTimeoutMs":250,"extra":1})"
  );
  REQUIRE(machdap::session::merge_launch_config(args, config));
  CHECK(config.program == "/build/App");
  CHECK(config.debugserver_port == 1234);
  CHECK(config.debugserver_host == "127.0.0.1");
  CHECK(config.debug_info == "/base/App.dSYM");
  CHECK(config.stop_on_entry);
  CHECK(config.reply_timeout_ms == 250);
  CHECK_FALSE(config.local_only());
  CHECK(machdap::session::validate_launch_config(config));

  auto json = machdap::session::to_json(config);
  CHECK(json["debugserverPort"] == 1234);
  CHECK(json["program"] == "/build/App");
}

TEST_CASE("launch arguments with the wrong type are rejected whole") {
  launch_config config;
  config.program = "/build/App";

  auto status = machdap::session::merge_launch_config(
      nlohmann::json::parse(R"({"program":"/other","stopOnEntry":"yes"})"), config
  );
  CHECK(status.code == machdap::error_code::invalid_argument);
  CHECK(status.error_message.find("stopOnEntry") != std::string::npos);
  CHECK(config.program == "/build/App");

  CHECK_FALSE(machdap::session::merge_launch_config(nlohmann::json::parse(R"({"debugserverPort":70000})"), config));
  CHECK_FALSE(machdap::session::merge_launch_config(nlohmann::json::parse(R"({"debugserverPort":-1})"), config));
  CHECK_FALSE(machdap::session::merge_launch_config(nlohmann::json::parse(R"({"debugserverPort":"12ab"})"), config));
  CHECK_FALSE(machdap::session::merge_launch_config(nlohmann::json::array(), config));
  CHECK(config.debugserver_port == 0);
}

TEST_CASE("launch configuration validation") {
  launch_config config;
  CHECK(machdap::session::validate_launch_config(config).error_message == "invalid argument: program is required");

  config.program = "/build/App";
  CHECK(config.local_only());
  CHECK(machdap::session::validate_launch_config(config));

  config.debugserver_port = 1234;
  config.debugserver_host.clear();
  CHECK_FALSE(machdap::session::validate_launch_config(config));
}

TEST_CASE("launch configuration from the environment") {
  launch_config config;
  ::setenv("MACHDAP_CONFIG", R"({"program":"/env/App","strictSymbols":true})", 1);
  REQUIRE(machdap::session::load_launch_config_env(config));
  CHECK(config.program == "/env/App");
  CHECK(config.strict_symbols);

  ::setenv("MACHDAP_CONFIG", "{broken", 1);
  CHECK_FALSE(machdap::session::load_launch_config_env(config));
  ::unsetenv("MACHDAP_CONFIG");
  CHECK(machdap::session::load_launch_config_env(config));

  CHECK_FALSE(machdap::session::load_launch_config_file("/nonexistent/machdap.json", config));
}
