// gir_model/registry/module_registry.hpp - Module discovery, version policy and load order
//
// Discovers <Namespace>-<Version>.gir.json files, groups them per namespace,
// applies the version policy, loads dependencies through a RawTreeReader and
// computes a deterministic load order.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/io/raw_tree_reader.hpp"
#include "gir_model/project/project_config.hpp"

namespace gir_model
{

// ============================================================================
// Matching helpers
// ============================================================================

/// Glob match supporting '*' (any run) and '?' (one character)
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

/**
 * Compare dotted versions component-wise ("3.10" > "3.9").
 *
 * Numeric components compare numerically, others lexically; a missing
 * component counts as 0. Returns <0, 0 or >0.
 */
[[nodiscard]] int compare_versions(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Module Files and Groups
// ============================================================================

struct ModuleFile
{
  std::string ns;
  std::string version;
  std::filesystem::path path;

  [[nodiscard]] std::string package_name() const { return ns + "-" + version; }
};

/// Parse "<Ns>-<Version>.gir.json"; std::nullopt for other file names
[[nodiscard]] std::optional<ModuleFile> parse_module_file_name(const std::filesystem::path & path);

enum class GroupState : uint8_t {
  Discovered,
  Grouped,
  Resolved,
  Conflicting,
  Failed,
};

[[nodiscard]] std::string_view group_state_name(GroupState state) noexcept;

struct ModuleGroup
{
  std::string ns;
  std::vector<ModuleFile> modules;  ///< candidate versions, ascending
  GroupState state = GroupState::Discovered;
  std::optional<size_t> selected;   ///< index into modules when Resolved
  bool has_conflict = false;
  bool auto_loaded = false;  ///< pulled in as a dependency, not requested

  [[nodiscard]] const ModuleFile * selected_module() const
  {
    return selected ? &modules[*selected] : nullptr;
  }
};

struct LoadedModule
{
  ModuleFile file;
  RawNamespace tree;
};

struct RegistryResult
{
  /// False only when the run is unsatisfiable (dependency cycle)
  bool success = false;

  std::vector<ModuleGroup> groups;

  /// Modules to build, dependencies before dependents
  std::vector<LoadedModule> load_order;

  /// Package names (or unmatched requests) that failed
  std::vector<std::string> failed;
};

// ============================================================================
// Module Registry
// ============================================================================

/**
 * Decides which (namespace, version) pairs participate in a run and in which
 * order they load.
 *
 * Diagnostics:
 *   M001 search directory missing      M005 dependency not found
 *   M002 request matched no module     M006 dependency failed
 *   M003 version conflict              M007 dependency cycle
 *   M004 raw tree unreadable
 */
class ModuleRegistry
{
public:
  ModuleRegistry(
    std::vector<std::filesystem::path> search_dirs, std::vector<std::string> ignore,
    VersionPolicy policy, DiagnosticBag * diags = nullptr);

  /**
   * Scan the search directories (non-recursively).
   *
   * A package found in an earlier directory shadows the same package in a
   * later one. Ignored packages are skipped.
   *
   * @return number of discovered modules
   */
  size_t discover();

  [[nodiscard]] const std::vector<ModuleFile> & discovered() const noexcept { return discovered_; }

  /// True if `package_name` matches an entry of the ignore list
  [[nodiscard]] bool is_ignored(std::string_view package_name) const;

  /// Discovered modules matching a request ("Gtk", "Gtk-4.0", "Gee-*", "Gtk-4")
  [[nodiscard]] std::vector<ModuleFile> match(std::string_view request) const;

  /**
   * Group the modules matching `requests` and apply the version policy.
   *
   * Does not read any raw tree.
   */
  [[nodiscard]] std::vector<ModuleGroup> group(const std::vector<std::string> & requests) const;

  /**
   * Full resolution: group, read raw trees, load dependencies, order.
   *
   * Calls discover() first if nothing has been discovered yet.
   */
  [[nodiscard]] RegistryResult resolve(
    const std::vector<std::string> & requests, const RawTreeReader & reader);

private:
  void apply_policy(ModuleGroup & group, const std::vector<std::string> & requests) const;

  [[nodiscard]] std::optional<ModuleFile> find_discovered(
    std::string_view ns, std::string_view version) const;
  [[nodiscard]] std::optional<ModuleFile> find_highest(std::string_view ns) const;

  std::vector<std::filesystem::path> search_dirs_;
  std::vector<std::string> ignore_;
  VersionPolicy policy_;
  DiagnosticBag * diags_;

  std::vector<ModuleFile> discovered_;
  bool scanned_ = false;
};

}  // namespace gir_model
