// girmodel - Developer driver for the gir_model library
//
// Usage:
//   girmodel list  [modules..] [--config girmodel.yaml] [-g dir]
//   girmodel check [modules..] [--config girmodel.yaml] [-g dir]
//   girmodel dump  [modules..] [--config girmodel.yaml] [-g dir] [-o model.json]
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "gir_model/basic/diagnostic_printer.hpp"
#include "gir_model/driver/pipeline.hpp"
#include "gir_model/io/model_json.hpp"
#include "gir_model/io/raw_tree_reader.hpp"
#include "gir_model/project/project_config.hpp"
#include "gir_model/registry/module_registry.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "girmodel v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [modules..] [options]\n\n"
            << "Commands:\n"
            << "  list                     List discovered modules, conflicts and failures\n"
            << "  check                    Build the model and print diagnostics\n"
            << "  dump                     Build the model and write it as JSON\n\n"
            << "Options:\n"
            << "  -c, --config <path>      Configuration file (default: girmodel.yaml, "
               "searched upward)\n"
            << "  -g, --gir-dir <path>     Add a search directory (repeatable)\n"
            << "  -i, --ignore <pattern>   Ignore a package or glob (repeatable)\n"
            << "  -p, --policy <policy>    Version policy: report, highest or prefix\n"
            << "  -j, --jobs <n>           Worker count (0 = hardware concurrency)\n"
            << "  -o, --output <path>      Output file for dump (default: stdout)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const gir_model::DiagnosticBag & diagnostics, bool allow_color)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = allow_color && isatty(fileno(stderr)) != 0;
  gir_model::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> modules;
  std::string config_path;
  std::vector<std::string> gir_dirs;
  std::vector<std::string> ignore;
  std::string policy;
  std::string jobs;
  std::string output_path;
  bool no_color = false;
  bool verbose = false;
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

    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if ((arg == "-g" || arg == "--gir-dir") && i + 1 < argc) {
      args.gir_dirs.emplace_back(argv[++i]);
    } else if ((arg == "-i" || arg == "--ignore") && i + 1 < argc) {
      args.ignore.emplace_back(argv[++i]);
    } else if ((arg == "-p" || arg == "--policy") && i + 1 < argc) {
      args.policy = argv[++i];
    } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
      args.jobs = argv[++i];
    } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
      args.output_path = argv[++i];
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.modules.push_back(arg);
    } else {
      std::cerr << "warning: ignoring unknown option '" << arg << "'\n";
    }
  }

  return args;
}

/// Load girmodel.yaml (explicit or searched upward) and apply command-line overrides
bool load_config(const CommandArgs & args, gir_model::ProjectConfig & config)
{
  if (!args.config_path.empty()) {
    const auto loaded = gir_model::load_project_config(args.config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return false;
    }
    config = loaded.config;
  } else if (auto found = gir_model::find_project_config(fs::current_path())) {
    const auto loaded = gir_model::load_project_config(*found);
    if (!loaded.success) {
      std::cerr << "error: " << found->string() << ": " << loaded.error << "\n";
      return false;
    }
    config = loaded.config;
    if (args.verbose) {
      fmt::print(stderr, "Using configuration: {}\n", found->string());
    }
  } else {
    config.project_root = fs::current_path();
  }

  if (!args.modules.empty()) {
    config.modules = args.modules;
  }
  for (const auto & dir : args.gir_dirs) {
    config.search_dirs.push_back(fs::absolute(dir));
  }
  for (const auto & pattern : args.ignore) {
    config.ignore.push_back(pattern);
  }
  if (!args.policy.empty()) {
    const auto policy = gir_model::parse_version_policy(args.policy);
    if (!policy) {
      std::cerr << "error: invalid policy '" << args.policy
                << "' (must be 'report', 'highest' or 'prefix')\n";
      return false;
    }
    config.version_policy = *policy;
  }
  if (!args.jobs.empty()) {
    try {
      const int jobs = std::stoi(args.jobs);
      if (jobs < 0) {
        throw std::out_of_range("negative");
      }
      config.jobs = static_cast<unsigned>(jobs);
    } catch (const std::logic_error &) {
      std::cerr << "error: invalid job count '" << args.jobs << "'\n";
      return false;
    }
  }
  if (config.search_dirs.empty()) {
    config.search_dirs.emplace_back("/usr/share/gir-1.0");
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_list(const CommandArgs & args)
{
  gir_model::ProjectConfig config;
  if (!load_config(args, config)) {
    return 1;
  }

  gir_model::DiagnosticBag diags;
  gir_model::ModuleRegistry registry(
    config.search_dirs, config.ignore, config.version_policy, &diags);
  registry.discover();

  std::vector<std::string> requests = config.modules;
  if (requests.empty()) {
    requests.emplace_back("*");
  }

  const gir_model::JsonRawTreeReader reader{};
  const auto result = registry.resolve(requests, reader);

  fmt::print("Search for raw trees in:\n");
  for (const auto & dir : config.search_dirs) {
    fmt::print("- {}\n", dir.string());
  }

  fmt::print("\nAvailable modules:\n");
  for (const auto & group : result.groups) {
    if (const auto * module = group.selected_module()) {
      fmt::print("- {}{}\n", module->package_name(), group.auto_loaded ? " (dependency)" : "");
      fmt::print("  - {}\n", module->path.string());
    }
  }

  bool has_conflicts = false;
  for (const auto & group : result.groups) {
    if (group.state != gir_model::GroupState::Conflicting) continue;
    if (!has_conflicts) {
      fmt::print("\nConflicts:\n");
      has_conflicts = true;
    }
    fmt::print("- {}\n", group.ns);
    for (const auto & module : group.modules) {
      fmt::print("  - {}\n", module.package_name());
      fmt::print("  - {}\n", module.path.string());
    }
  }

  if (!result.failed.empty()) {
    fmt::print("\nDependencies not found or failed:\n");
    for (const auto & failed : result.failed) {
      fmt::print("- {}\n", failed);
    }
  }

  if (args.verbose && !diags.empty()) {
    print_diagnostics(diags, !args.no_color);
  }
  return result.success ? 0 : 1;
}

gir_model::PipelineResult run_pipeline(const CommandArgs & args, bool & config_ok)
{
  gir_model::ProjectConfig config;
  config_ok = load_config(args, config);
  if (!config_ok) {
    return {};
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Building {} request(s) with policy '{}'\n", config.modules.size(),
      gir_model::version_policy_name(config.version_policy));
  }

  gir_model::PipelineOptions options;
  options.verbose = args.verbose;

  const gir_model::JsonRawTreeReader reader{};
  return gir_model::Pipeline::run(config, reader, options);
}

int cmd_check(const CommandArgs & args)
{
  bool config_ok = false;
  const auto result = run_pipeline(args, config_ok);
  if (!config_ok) {
    return 1;
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, !args.no_color);
  }
  if (result.report_path) {
    std::cerr << "Report: " << result.report_path->string() << "\n";
  }

  if (result.success) {
    std::cout << result.model.size() << " namespace(s), " << result.records.size()
              << " conflict(s): OK\n";
    return 0;
  }
  return 1;
}

int cmd_dump(const CommandArgs & args)
{
  bool config_ok = false;
  const auto result = run_pipeline(args, config_ok);
  if (!config_ok) {
    return 1;
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, !args.no_color);
  }

  nlohmann::json out = gir_model::model_to_json(result.model, result.groups);
  out["report"] = gir_model::report_to_json(result.records, result.diagnostics);
  const std::string text = out.dump(2);

  if (args.output_path.empty()) {
    std::cout << text << "\n";
  } else {
    std::ofstream file(args.output_path);
    if (!file.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return 1;
    }
    file << text << "\n";
    if (args.verbose) {
      fmt::print(stderr, "Wrote {}\n", args.output_path);
    }
  }

  return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "list") {
    return cmd_list(args);
  }
  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "dump") {
    return cmd_dump(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
