// gir_model/project/project_config.hpp - Run configuration (girmodel.yaml)
//
// Parses and validates girmodel.yaml. Relative search directories are resolved
// against the directory holding the file.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "gir_model/sema/patch_hooks.hpp"

namespace gir_model
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * How a namespace discovered in more than one version is handled.
 */
enum class VersionPolicy : uint8_t {
  Report,   ///< keep the group Conflicting, load nothing
  Highest,  ///< pick the highest version
  Prefix,   ///< pick the single version a request names explicitly
};

[[nodiscard]] std::string_view version_policy_name(VersionPolicy policy) noexcept;
[[nodiscard]] std::optional<VersionPolicy> parse_version_policy(std::string_view text) noexcept;

struct ReportConfig
{
  bool enabled = false;
  std::filesystem::path output = "girmodel-report.json";
};

/**
 * Complete run configuration.
 */
struct ProjectConfig
{
  /// Requested modules: "Gtk-4.0", "Gtk" (any version), "Gee-*"
  std::vector<std::string> modules;

  /// Directories scanned (non-recursively) for <Ns>-<Version>.gir.json
  std::vector<std::filesystem::path> search_dirs;

  /// Package names or globs to skip
  std::vector<std::string> ignore;

  VersionPolicy version_policy = VersionPolicy::Report;
  bool infer_generics = true;

  /// Worker count; 0 means hardware concurrency
  unsigned jobs = 0;

  std::string universal_base = "GObject.Object";
  std::set<std::string> reserved_members = {"connect", "connect_after", "emit"};
  std::map<std::string, std::set<std::string>> known_conflicts;
  std::vector<ScopedCorrection> scoped_corrections;

  ReportConfig report;

  /// Directory containing girmodel.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a girmodel.yaml file.
 *
 * @param config_path Path to girmodel.yaml
 * @return ConfigLoadResult with the loaded config or an error naming the bad key
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative search directories resolve against `root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & root);

/**
 * Find girmodel.yaml by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to girmodel.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "girmodel.yaml";

}  // namespace gir_model
