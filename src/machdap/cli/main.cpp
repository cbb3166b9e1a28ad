#include <exception>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "machdap/base/cli/verbosity.hpp"

#include "commands/serve.hpp"
#include "commands/symbols.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});
args::ValueFlag<std::string> config_flag(arguments, "path", "launch configuration JSON file", {"config"});
args::Flag strict_symbols_flag(arguments, "strict", "fail launch when debug info is missing", {"strict-symbols"});

void apply_verbosity() {
  int count = args::get(verbosity_flag);
  if (count == 0) {
    count = machdap::cli::verbosity_from_env();
  }
  machdap::cli::apply_verbosity(count);
}
} // namespace cli

namespace {
auto log_main = redlog::get_logger("machdap");
int g_exit_code = 0;
bool g_command_ran = false;
} // namespace

void cmd_serve(args::Subparser& parser) {
  parser.Parse();
  cli::apply_verbosity();
  g_command_ran = true;

  machdap::commands::serve_options options;
  options.config_path = cli::config_flag ? args::get(cli::config_flag) : "";
  options.strict_symbols = cli::strict_symbols_flag;

  g_exit_code = machdap::commands::serve(options);
}

void cmd_symbols(args::Subparser& parser) {
  args::ValueFlag<std::string> program_flag(parser, "path", "Mach-O program", {'p', "program"});
  args::ValueFlag<std::string> dsym_flag(parser, "path", "dSYM bundle or DWARF file", {"dsym"});
  args::ValueFlag<std::string> slide_flag(parser, "slide", "load slide applied to addresses", {"slide"});
  args::ValueFlagList<std::string> address_flag(parser, "address", "runtime address to symbolicate", {'a', "address"});
  args::ValueFlagList<std::string> location_flag(parser, "file:line", "source location to resolve", {'l', "location"});
  parser.Parse();
  cli::apply_verbosity();
  g_command_ran = true;

  if (!program_flag) {
    log_main.err("program path required");
    std::cerr << "error: --program is required" << std::endl;
    g_exit_code = 1;
    return;
  }

  machdap::commands::symbols_options options;
  options.program_path = *program_flag;
  options.dsym_path = dsym_flag ? *dsym_flag : "";
  options.slide = slide_flag ? *slide_flag : "";
  options.addresses = args::get(address_flag);
  options.locations = args::get(location_flag);
  options.strict_symbols = cli::strict_symbols_flag;

  g_exit_code = machdap::commands::symbols(options);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("machdap - debug adapter for debugserver", "serves DAP on stdio when no command is given");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command serve_cmd(commands, "serve", "serve DAP on stdio", &cmd_serve);
  args::Command symbols_cmd(commands, "symbols", "query the debug info of a Mach-O program", &cmd_symbols);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
    return 0;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  if (!g_command_ran) {
    cli::apply_verbosity();
    machdap::commands::serve_options options;
    options.config_path = cli::config_flag ? args::get(cli::config_flag) : "";
    options.strict_symbols = cli::strict_symbols_flag;
    return machdap::commands::serve(options);
  }

  return g_exit_code;
}
