// gir_model/driver/pipeline.hpp - Model building pipeline
//
// Single entry point for load -> build -> patch -> resolve -> analyze -> apply.
// Used by the girmodel tool and by rendering collaborators.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/io/raw_tree_reader.hpp"
#include "gir_model/model/model.hpp"
#include "gir_model/project/project_config.hpp"
#include "gir_model/registry/module_registry.hpp"
#include "gir_model/sema/conflict_detector.hpp"
#include "gir_model/sema/patch_hooks.hpp"

namespace gir_model
{

// ============================================================================
// Pipeline Options
// ============================================================================

struct PipelineOptions
{
  /// Print per-stage progress to stderr
  bool verbose = false;

  /// Write the report file when the configuration enables it
  bool write_report = true;
};

// ============================================================================
// Pipeline Result
// ============================================================================

struct PipelineResult
{
  /// Whether the run produced no errors
  bool success = false;

  /// Diagnostics of every stage, merged in load order
  DiagnosticBag diagnostics;

  /// Resolved and annotated namespaces in load order
  Model model;

  /// Registry groups, including Conflicting and Failed ones
  std::vector<ModuleGroup> groups;
  std::vector<std::string> failed;

  /// Conflict records of every namespace, in load order
  std::vector<ConflictRecord> records;

  /// Set when a report file was written
  std::optional<std::filesystem::path> report_path;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * Orchestrates a run.
 *
 * Stages:
 * 1. Module registry (discovery, version policy, dependency order)
 * 2. Per-namespace symbol table building and patch hooks (parallel)
 * 3. Type resolution (parallel, one task per namespace)
 * 4. Conflict analysis (parallel, read-only)
 * 5. Conflict application and reporting (after the analysis barrier)
 */
class Pipeline
{
public:
  /**
   * Run the whole pipeline for a configuration.
   *
   * @param config Run configuration (from girmodel.yaml)
   * @param reader Raw tree reader for discovered modules
   * @param options Pipeline options
   */
  [[nodiscard]] static PipelineResult run(
    const ProjectConfig & config, const RawTreeReader & reader,
    const PipelineOptions & options = {});

  /**
   * Run from raw trees already in load order (no registry stage).
   */
  [[nodiscard]] static PipelineResult run_trees(
    std::vector<RawNamespace> trees, const ProjectConfig & config,
    const PipelineOptions & options = {});

  /// Built-in hooks plus the configured scoped corrections
  [[nodiscard]] static PatchHookRegistry make_hooks(const ProjectConfig & config);

  [[nodiscard]] static ConflictOptions conflict_options(const ProjectConfig & config);

private:
  static void build_model(
    std::vector<RawNamespace> trees, const ProjectConfig & config,
    const PipelineOptions & options, PipelineResult & result);

  static bool write_report(
    const ProjectConfig & config, PipelineResult & result, const PipelineOptions & options);
};

}  // namespace gir_model
