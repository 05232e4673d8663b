// polyschema - catalog and payload checker
//
// Usage:
//   polyschema check [catalog.yaml]
//   polyschema list [catalog.yaml] [--hierarchy NAME]
//   polyschema validate [catalog.yaml] --hierarchy NAME <payload.json>...
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "polyschema/basic/diagnostic_printer.hpp"
#include "polyschema/basic/logging.hpp"
#include "polyschema/catalog/catalog.hpp"
#include "polyschema/core/errors.hpp"
#include "polyschema/dispatch/dispatcher.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "polyschema v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [catalog.yaml]                 Load and register a catalog\n"
            << "  list [catalog.yaml]                  List hierarchies and their variants\n"
            << "  validate [catalog.yaml] <file>...    Validate JSON payload files\n\n"
            << "Options:\n"
            << "  -c, --catalog <path>     Catalog file (default: polyschema.yaml, searched upward)\n"
            << "  -H, --hierarchy <name>   Hierarchy to list or validate against\n"
            << "  -v, --verbose            Verbose output (log level debug)\n"
            << "  -q, --quiet              Disable logging\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string catalog_path;
  std::string hierarchy;
  std::vector<std::string> inputs;
  bool verbose = false;
  bool quiet = false;
  bool show_help = false;
  std::string usage_error;
};

bool is_yaml_path(const std::string & path)
{
  const std::string ext = fs::path(path).extension().string();
  return ext == ".yaml" || ext == ".yml";
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--catalog") {
      if (i + 1 >= argc) {
        args.usage_error = arg + " requires a path";
        return args;
      }
      args.catalog_path = argv[++i];
    } else if (arg == "-H" || arg == "--hierarchy") {
      if (i + 1 >= argc) {
        args.usage_error = arg + " requires a name";
        return args;
      }
      args.hierarchy = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.usage_error = "unknown option '" + arg + "'";
      return args;
    } else if (args.catalog_path.empty() && args.inputs.empty() && is_yaml_path(arg)) {
      args.catalog_path = arg;
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Catalog
// ============================================================================

/// Load the catalog and register it; prints errors and returns false on failure
bool load_into(const CommandArgs & args, polyschema::Registry & registry)
{
  fs::path path;
  if (!args.catalog_path.empty()) {
    path = args.catalog_path;
  } else {
    auto found = polyschema::find_catalog(fs::current_path());
    if (!found) {
      std::cerr << "error: no " << polyschema::k_catalog_file_name
                << " found in current directory or parents\n";
      return false;
    }
    path = *found;
  }

  const auto result = polyschema::load_catalog(path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return false;
  }

  // Command-line flags take precedence over the catalog's log level.
  if (result.catalog.settings.log_level && !args.verbose && !args.quiet) {
    polyschema::set_log_level(*result.catalog.settings.log_level);
  }

  try {
    polyschema::apply_catalog(registry, result.catalog);
  } catch (const polyschema::Error & e) {
    std::cerr << path.string() << ": error[" << polyschema::to_string(e.kind())
              << "]: " << e.what() << "\n";
    return false;
  } catch (const std::invalid_argument & e) {
    std::cerr << path.string() << ": error: " << e.what() << "\n";
    return false;
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  polyschema::Registry registry;
  if (!load_into(args, registry)) {
    return k_exit_failure;
  }

  size_t variants = 0;
  const auto hierarchies = registry.hierarchies();
  for (const auto & info : hierarchies) {
    variants += registry.descriptors(info.id).size();
  }
  std::cerr << "OK: " << hierarchies.size() << " hierarchies, " << variants << " variants\n";
  return k_exit_ok;
}

int cmd_list(const CommandArgs & args)
{
  polyschema::Registry registry;
  if (!load_into(args, registry)) {
    return k_exit_failure;
  }

  bool listed = false;
  for (const auto & info : registry.hierarchies()) {
    if (!args.hierarchy.empty() && info.name != args.hierarchy) {
      continue;
    }
    listed = true;

    const auto snapshot = registry.snapshot(info.id);
    std::cout << info.name << " (discriminator '" << info.discriminator_field << "', "
              << polyschema::to_string(info.kind) << ")\n";
    if (snapshot->empty()) {
      std::cout << "  (no variants)\n";
      continue;
    }
    for (const auto & value : snapshot->known_values()) {
      const auto descriptor = snapshot->find(value);
      std::cout << "  " << value.display() << " -> " << descriptor->name();
      if (descriptor->parent()) {
        std::cout << " (extends " << descriptor->parent()->name() << ")";
      }
      std::cout << "\n";
    }
  }

  if (!args.hierarchy.empty() && !listed) {
    std::cerr << "error: unknown hierarchy '" << args.hierarchy << "'\n";
    return k_exit_failure;
  }
  return k_exit_ok;
}

int cmd_validate(const CommandArgs & args)
{
  if (args.hierarchy.empty() || args.inputs.empty()) {
    std::cerr << "error: validate requires --hierarchy and at least one payload file\n";
    std::cerr << "usage: polyschema validate [catalog.yaml] --hierarchy NAME <payload.json>...\n";
    return k_exit_usage;
  }

  polyschema::Registry registry;
  if (!load_into(args, registry)) {
    return k_exit_failure;
  }

  const auto hierarchy = registry.find_hierarchy(args.hierarchy);
  if (!hierarchy) {
    std::cerr << "error: unknown hierarchy '" << args.hierarchy << "'\n";
    return k_exit_failure;
  }

  const polyschema::Dispatcher dispatcher(registry);
  polyschema::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  int exit_code = k_exit_ok;

  for (const auto & input : args.inputs) {
    std::ifstream file(input);
    if (!file.is_open()) {
      std::cerr << "error: failed to open file: " << input << "\n";
      exit_code = k_exit_failure;
      continue;
    }

    nlohmann::json payload;
    try {
      payload = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error & e) {
      std::cerr << input << ": error: invalid JSON: " << e.what() << "\n";
      exit_code = k_exit_failure;
      continue;
    }

    const auto result = dispatcher.validate(*hierarchy, payload);
    if (result.success) {
      std::cout << input << ": " << result.value->descriptor->name() << "\n"
                << result.value->fields.dump(2) << "\n";
      continue;
    }

    exit_code = k_exit_failure;
    printer.print(result.error->to_diagnostic(), input);
    printer.print_all(result.error->diagnostics, input);
  }

  return exit_code;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.verbose) {
    polyschema::set_log_level(polyschema::LogLevel::Debug);
  } else if (args.quiet) {
    polyschema::set_log_level(polyschema::LogLevel::Off);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "list") {
    return cmd_list(args);
  }

  if (args.command == "validate") {
    return cmd_validate(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
