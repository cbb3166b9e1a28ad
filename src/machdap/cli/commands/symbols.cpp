#include "symbols.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>

#include <redlog.hpp>

#include "machdap/base/error.hpp"
#include "machdap/session/expression.hpp"
#include "machdap/symbols/symbol_store.hpp"

namespace machdap::commands {

namespace {

std::optional<uint64_t> parse_unsigned(const std::string& text, int base) {
  if (text.empty() || text.front() == '-') {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, base);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

std::optional<int64_t> parse_slide(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 0);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

void print_location(uint64_t address, const std::optional<symbols::source_location>& location,
                    const std::optional<std::string>& function) {
  std::cout << session::format_address(address) << "  ";
  if (location) {
    std::cout << (location->function.empty() ? function.value_or("unknown") : location->function) << " at "
              << location->file << ":" << location->line;
    if (location->column != 0) {
      std::cout << ":" << location->column;
    }
  } else {
    std::cout << function.value_or("unknown") << " (no line info)";
  }
  std::cout << std::endl;
}

} // namespace

int symbols(const symbols_options& options) {
  auto log = redlog::get_logger("machdap.symbols");

  if (options.program_path.empty()) {
    log.err("program path required");
    std::cerr << "error: --program is required" << std::endl;
    return 1;
  }

  symbols::load_options load;
  load.program_path = options.program_path;
  if (!options.dsym_path.empty()) {
    load.debug_info_path = options.dsym_path;
  }
  load.strict = options.strict_symbols;

  symbols::symbol_store store;
  if (auto status = store.load(load); !status) {
    log.err("failed to load module", redlog::field("error", status.error_message));
    std::cerr << "error: " << status.error_message << std::endl;
    return 1;
  }

  if (!options.slide.empty()) {
    auto slide = parse_slide(options.slide);
    if (!slide) {
      std::cerr << "error: invalid --slide value: " << options.slide << std::endl;
      return 1;
    }
    store.set_slide(*slide);
  }

  const auto& module = store.module();
  std::cout << "module:      " << module.path << std::endl;
  std::cout << "debug info:  " << (module.debug_path.empty() ? "<none>" : module.debug_path) << std::endl;
  std::cout << "arch:        " << symbols::cpu_arch_name(module.arch) << std::endl;
  std::cout << "uuid:        " << (module.uuid.empty() ? "<none>" : module.uuid) << std::endl;
  std::cout << "__TEXT:      " << session::format_address(module.text_vmaddr) << " size 0x" << std::hex
            << module.text_size << std::dec << std::endl;
  std::cout << "slide:       " << store.slide() << std::endl;
  std::cout << "line rows:   " << store.line_entry_count() << std::endl;
  std::cout << "functions:   " << store.function_count() << std::endl;
  std::cout << "files:       " << store.files().size() << std::endl;
  for (const auto& diagnostic : store.diagnostics()) {
    std::cout << "warning: " << diagnostic.error_message << std::endl;
  }

  int exit_code = 0;
  for (const auto& text : options.addresses) {
    auto address = parse_unsigned(text, 0);
    if (!address) {
      std::cerr << "error: invalid address: " << text << std::endl;
      exit_code = 1;
      continue;
    }
    print_location(*address, store.resolve_address(*address), store.resolve_function(*address));
  }

  for (const auto& text : options.locations) {
    size_t colon = text.rfind(':');
    std::optional<uint64_t> line;
    if (colon != std::string::npos) {
      line = parse_unsigned(text.substr(colon + 1), 10);
    }
    if (!line || *line == 0 || *line > UINT32_MAX) {
      std::cerr << "error: expected file:line, got " << text << std::endl;
      exit_code = 1;
      continue;
    }
    std::string file = text.substr(0, colon);
    auto address = store.resolve_location(file, static_cast<uint32_t>(*line));
    if (!address) {
      std::cout << text << "  no code" << std::endl;
      continue;
    }
    std::cout << text << " -> ";
    print_location(*address, store.resolve_address(*address), store.resolve_function(*address));
  }

  return exit_code;
}

} // namespace machdap::commands
