// rvir - Region-structured IR command line interface
//
// Usage:
//   rvir samples [name...] [--config rvir.yaml] [--json] [--no-color]
//   rvir dump <sample> [--config rvir.yaml]
//
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <nlohmann/json.hpp>

#include "rvir/basic/diagnostic_printer.hpp"
#include "rvir/driver/samples.hpp"
#include "rvir/graph/describe.hpp"
#include "rvir/graph/json_dump.hpp"
#include "rvir/project/tool_config.hpp"
#include "rvir/store/value_store.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "rvir v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  samples [name...]        Build and evaluate reference programs\n"
            << "  dump <name>              Print a reference program as JSON\n\n"
            << "Options:\n"
            << "  -c, --config <path>      Configuration file (default: nearest rvir.yaml)\n"
            << "  --json                   JSON output\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> names;
  std::string config_path;
  bool json = false;
  bool no_color = false;
  bool show_help = false;
};

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

    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.names.push_back(arg);
    }
  }

  return args;
}

/// Explicit --config, else the nearest rvir.yaml, else the defaults
rvir::ConfigLoadResult resolve_config(const CommandArgs & args)
{
  if (!args.config_path.empty()) {
    return rvir::load_tool_config(args.config_path);
  }
  if (auto found = rvir::find_tool_config(fs::current_path())) {
    return rvir::load_tool_config(*found);
  }
  return rvir::ConfigLoadResult::ok(rvir::ToolConfig{});
}

bool use_color(const rvir::ToolConfig & config, const CommandArgs & args)
{
  if (args.no_color) {
    return false;
  }
  switch (config.output.color) {
    case rvir::ColorMode::Always:
      return true;
    case rvir::ColorMode::Never:
      return false;
    case rvir::ColorMode::Auto:
      break;
  }
  // Detect if terminal supports colors (simple check for TTY)
  return isatty(fileno(stderr)) != 0;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_samples(const CommandArgs & args, const rvir::ToolConfig & config)
{
  rvir::ValueStore store(config.store.to_options());
  rvir::DiagnosticBag diags;

  std::vector<rvir::SampleResult> results;
  if (args.names.empty()) {
    results = rvir::run_samples(store, diags);
  } else {
    for (const auto & name : args.names) {
      results.push_back(rvir::run_sample(name, store, diags));
    }
  }

  rvir::DiagnosticPrinter printer(std::cerr, use_color(config, args));
  printer.print_all(diags);

  bool all_passed = true;
  const bool json = args.json || config.output.format == rvir::OutputFormat::Json;
  if (json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto & r : results) {
      out.push_back(
        {{"name", r.name},
         {"passed", r.passed},
         {"cases", r.cases},
         {"detail", r.detail},
         {"program", rvir::describe(r.program)}});
      all_passed = all_passed && r.passed;
    }
    std::cout << out.dump(2) << "\n";
  } else {
    for (const auto & r : results) {
      fmt::print(std::cout, "{:<12} {} ({} cases)\n", r.name, r.passed ? "ok" : "FAILED", r.cases);
      if (!r.passed && !r.detail.empty()) {
        fmt::print(std::cout, "             {}\n", r.detail);
      }
      all_passed = all_passed && r.passed;
    }
  }

  const size_t evicted = store.collect();
  if (!json) {
    fmt::print(
      std::cout, "store: {} node(s), {} region(s) resident, {} collected\n", store.size(),
      store.region_count(), evicted);
  }
  return all_passed ? 0 : 1;
}

int cmd_dump(const CommandArgs & args, const rvir::ToolConfig & config)
{
  if (args.names.size() != 1) {
    std::cerr << "error: exactly one sample name required\n";
    std::cerr << "usage: rvir dump <name>\n";
    return 1;
  }

  rvir::ValueStore store(config.store.to_options());
  rvir::DiagnosticBag diags;
  const auto result = rvir::run_sample(args.names.front(), store, diags);
  if (diags.has_errors()) {
    rvir::DiagnosticPrinter printer(std::cerr, use_color(config, args));
    printer.print_all(diags);
    return 1;
  }

  std::cout << rvir::to_json(result.program).dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  const auto config_result = resolve_config(args);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  if (args.command == "samples") {
    return cmd_samples(args, config_result.config);
  }

  if (args.command == "dump") {
    return cmd_dump(args, config_result.config);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
