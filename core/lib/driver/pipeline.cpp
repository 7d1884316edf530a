// gir_model/driver/pipeline.cpp - Pipeline implementation
//
#include "gir_model/driver/pipeline.hpp"

#include <fmt/core.h>

#include <fstream>
#include <utility>

#include "gir_model/io/model_json.hpp"
#include "gir_model/sema/builtin_hooks.hpp"
#include "gir_model/sema/class_hierarchy.hpp"
#include "gir_model/sema/symbol_table_builder.hpp"
#include "gir_model/sema/type_resolver.hpp"
#include "gir_model/support/parallel.hpp"

namespace gir_model
{

namespace
{

void report_pipeline_error(DiagnosticBag & diags, const std::string & message)
{
  diags.report_error(SymbolLocation{}, message).with_code("P001");
}

}  // namespace

PatchHookRegistry Pipeline::make_hooks(const ProjectConfig & config)
{
  PatchHookRegistry hooks;
  register_builtin_hooks(hooks);
  for (const auto & correction : config.scoped_corrections) {
    hooks.add(make_scoped_correction_hook(correction));
  }
  return hooks;
}

ConflictOptions Pipeline::conflict_options(const ProjectConfig & config)
{
  ConflictOptions options;
  options.universal_base = config.universal_base;
  options.reserved_members = config.reserved_members;
  options.known_conflicts = config.known_conflicts;
  return options;
}

PipelineResult Pipeline::run(
  const ProjectConfig & config, const RawTreeReader & reader, const PipelineOptions & options)
{
  PipelineResult result;

  if (config.modules.empty()) {
    report_pipeline_error(result.diagnostics, "no modules requested");
    return result;
  }

  try {
    ModuleRegistry registry(
      config.search_dirs, config.ignore, config.version_policy, &result.diagnostics);
    const size_t discovered = registry.discover();
    if (options.verbose) {
      fmt::print(stderr, "[registry] discovered {} module(s)\n", discovered);
    }

    RegistryResult loaded = registry.resolve(config.modules, reader);
    result.groups = std::move(loaded.groups);
    result.failed = std::move(loaded.failed);
    if (!loaded.success) {
      // Unsatisfiable (dependency cycle): nothing is built
      return result;
    }

    std::vector<RawNamespace> trees;
    trees.reserve(loaded.load_order.size());
    for (auto & module : loaded.load_order) {
      if (options.verbose) {
        fmt::print(stderr, "[registry] load {}\n", module.file.package_name());
      }
      trees.push_back(std::move(module.tree));
    }

    build_model(std::move(trees), config, options, result);
  } catch (const std::exception & e) {
    report_pipeline_error(result.diagnostics, std::string("pipeline aborted: ") + e.what());
    return result;
  }

  if (options.write_report && config.report.enabled) {
    write_report(config, result, options);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

PipelineResult Pipeline::run_trees(
  std::vector<RawNamespace> trees, const ProjectConfig & config, const PipelineOptions & options)
{
  PipelineResult result;
  try {
    build_model(std::move(trees), config, options, result);
  } catch (const std::exception & e) {
    report_pipeline_error(result.diagnostics, std::string("pipeline aborted: ") + e.what());
    return result;
  }
  result.success = !result.diagnostics.has_errors();
  return result;
}

void Pipeline::build_model(
  std::vector<RawNamespace> trees, const ProjectConfig & config, const PipelineOptions & options,
  PipelineResult & result)
{
  const size_t count = trees.size();
  const unsigned jobs = config.jobs;

  std::vector<DiagnosticBag> bags(count);
  std::vector<std::unique_ptr<Namespace>> built(count);

  // 1. Symbol tables and patch hooks, one task per namespace
  const PatchHookRegistry hooks = make_hooks(config);
  HookContext ctx;
  ctx.infer_generics = config.infer_generics;

  std::vector<size_t> hooks_applied(count, 0);
  parallel_for_each(count, jobs, [&](size_t i) {
    SymbolTableBuilder builder(&bags[i]);
    built[i] = builder.build(trees[i]);
    hooks_applied[i] = hooks.run(*built[i], ctx, bags[i]);
  });

  for (size_t i = 0; i < count; ++i) {
    if (options.verbose) {
      fmt::print(
        stderr, "[build] {}: {} symbol(s), {} hook(s) applied\n", built[i]->package_name(),
        built[i]->symbol_count(), hooks_applied[i]);
    }
    result.model.add(std::move(built[i]));
  }

  // 2. Type resolution (reads immutable symbol tables, writes own slots)
  const NativeTypeIndex index(result.model);
  const TypeResolver resolver(result.model, index);
  const auto & namespaces = result.model.namespaces();

  std::vector<size_t> fallbacks(count, 0);
  parallel_for_each(count, jobs, [&](size_t i) {
    fallbacks[i] = resolver.resolve_namespace(*namespaces[i], bags[i]);
  });
  if (options.verbose) {
    for (size_t i = 0; i < count; ++i) {
      fmt::print(
        stderr, "[resolve] {}: {} unresolved reference(s)\n", namespaces[i]->package_name(),
        fallbacks[i]);
    }
  }

  // 3. Conflict analysis (read-only over the whole model)
  const ClassHierarchy hierarchy(result.model);
  const ConflictDetector detector(hierarchy, conflict_options(config));

  std::vector<std::vector<ConflictRecord>> records(count);
  parallel_for_each(
    count, jobs, [&](size_t i) { records[i] = detector.analyze(*namespaces[i]); });

  // 4. Application, after every namespace has been analyzed
  parallel_for_each(count, jobs, [&](size_t i) {
    ConflictDetector::apply(*namespaces[i], records[i]);
    ConflictDetector::report(*namespaces[i], records[i], bags[i]);
  });

  for (size_t i = 0; i < count; ++i) {
    if (options.verbose) {
      fmt::print(
        stderr, "[conflicts] {}: {} record(s)\n", namespaces[i]->package_name(),
        records[i].size());
    }
    result.diagnostics.merge(std::move(bags[i]));
    result.records.insert(result.records.end(), records[i].begin(), records[i].end());
  }
}

bool Pipeline::write_report(
  const ProjectConfig & config, PipelineResult & result, const PipelineOptions & options)
{
  namespace fs = std::filesystem;

  const fs::path & output = config.report.output;
  std::error_code ec;
  if (output.has_parent_path()) {
    fs::create_directories(output.parent_path(), ec);
    if (ec) {
      report_pipeline_error(
        result.diagnostics,
        fmt::format("cannot create report directory '{}': {}", output.parent_path().string(),
                    ec.message()));
      return false;
    }
  }

  std::ofstream out(output);
  if (!out) {
    report_pipeline_error(
      result.diagnostics, fmt::format("cannot write report '{}'", output.string()));
    return false;
  }
  out << report_to_json(result.records, result.diagnostics).dump(2) << "\n";

  if (options.verbose) {
    fmt::print(stderr, "[report] wrote {}\n", output.string());
  }
  result.report_path = output;
  return true;
}

}  // namespace gir_model
