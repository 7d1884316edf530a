// gir_model/project/project_config.cpp - Configuration loading
//
#include "gir_model/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace gir_model
{

std::string_view version_policy_name(VersionPolicy policy) noexcept
{
  switch (policy) {
    case VersionPolicy::Report:
      return "report";
    case VersionPolicy::Highest:
      return "highest";
    case VersionPolicy::Prefix:
      return "prefix";
  }
  return "report";
}

std::optional<VersionPolicy> parse_version_policy(std::string_view text) noexcept
{
  if (text == "report") return VersionPolicy::Report;
  if (text == "highest") return VersionPolicy::Highest;
  if (text == "prefix") return VersionPolicy::Prefix;
  return std::nullopt;
}

namespace
{

/// Read a list of scalars; fails with the key name when the node is not a list
bool read_string_list(
  const YAML::Node & node, const char * key, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(key) + " entries must be strings";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Convert a scalar; fails with the key name on a type mismatch
template <typename T>
bool read_scalar(const YAML::Node & node, const char * key, T & out, std::string & error)
{
  try {
    out = node.as<T>();
    return true;
  } catch (const YAML::BadConversion &) {
    error = std::string("invalid value for '") + key + "'";
    return false;
  }
}

std::optional<ScopedCorrection> parse_correction(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "entry must be a map";
    return std::nullopt;
  }

  ScopedCorrection c;
  for (const char * required : {"namespace", "version", "class", "member", "container", "name"}) {
    if (!node[required]) {
      error = std::string("missing '") + required + "'";
      return std::nullopt;
    }
  }
  c.ns = node["namespace"].as<std::string>();
  c.version = node["version"].as<std::string>();
  c.class_name = node["class"].as<std::string>();
  c.member = node["member"].as<std::string>();
  c.container = node["container"].as<std::string>();
  c.name = node["name"].as<std::string>();
  if (node["parameter"]) {
    c.parameter = node["parameter"].as<std::string>();
  }
  return c;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;
  std::string error;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["modules"] && !read_string_list(root["modules"], "modules", config.modules, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (root["search_dirs"]) {
    std::vector<std::string> dirs;
    if (!read_string_list(root["search_dirs"], "search_dirs", dirs, error)) {
      return ConfigLoadResult::fail(error);
    }
    for (const auto & d : dirs) {
      std::filesystem::path p(d);
      config.search_dirs.push_back(p.is_absolute() ? p : project_root / p);
    }
  }

  if (root["ignore"] && !read_string_list(root["ignore"], "ignore", config.ignore, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (root["version_policy"]) {
    std::string text;
    if (!read_scalar(root["version_policy"], "version_policy", text, error)) {
      return ConfigLoadResult::fail(error);
    }
    auto policy = parse_version_policy(text);
    if (!policy) {
      return ConfigLoadResult::fail(
        "invalid version_policy: '" + text + "' (must be 'report', 'highest' or 'prefix')");
    }
    config.version_policy = *policy;
  }

  if (root["infer_generics"]) {
    if (!read_scalar(root["infer_generics"], "infer_generics", config.infer_generics, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  if (root["jobs"]) {
    int jobs = 0;
    if (!read_scalar(root["jobs"], "jobs", jobs, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (jobs < 0) {
      return ConfigLoadResult::fail("jobs must be zero or positive");
    }
    config.jobs = static_cast<unsigned>(jobs);
  }

  if (root["universal_base"]) {
    if (!read_scalar(root["universal_base"], "universal_base", config.universal_base, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  if (root["reserved_members"]) {
    std::vector<std::string> names;
    if (!read_string_list(root["reserved_members"], "reserved_members", names, error)) {
      return ConfigLoadResult::fail(error);
    }
    config.reserved_members = std::set<std::string>(names.begin(), names.end());
  }

  if (root["known_conflicts"]) {
    const auto & node = root["known_conflicts"];
    if (!node.IsMap()) {
      return ConfigLoadResult::fail("known_conflicts must be a map of namespace to member names");
    }
    for (const auto & entry : node) {
      const auto ns = entry.first.as<std::string>();
      std::vector<std::string> names;
      const std::string key = "known_conflicts." + ns;
      if (!read_string_list(entry.second, key.c_str(), names, error)) {
        return ConfigLoadResult::fail(error);
      }
      config.known_conflicts[ns].insert(names.begin(), names.end());
    }
  }

  if (root["scoped_corrections"]) {
    const auto & node = root["scoped_corrections"];
    if (!node.IsSequence()) {
      return ConfigLoadResult::fail("scoped_corrections must be a list");
    }
    for (const auto & item : node) {
      auto correction = parse_correction(item, error);
      if (!correction) {
        return ConfigLoadResult::fail("invalid scoped_corrections entry: " + error);
      }
      config.scoped_corrections.push_back(std::move(*correction));
    }
  }

  if (root["report"]) {
    const auto & report = root["report"];
    if (!report.IsMap()) {
      return ConfigLoadResult::fail("report must be a map");
    }
    if (report["enabled"]) {
      if (!read_scalar(report["enabled"], "report.enabled", config.report.enabled, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (report["output"]) {
      std::string out;
      if (!read_scalar(report["output"], "report.output", out, error)) {
        return ConfigLoadResult::fail(error);
      }
      config.report.output = out;
    }
  }
  if (config.report.output.is_relative()) {
    config.report.output = project_root / config.report.output;
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & root)
{
  try {
    return parse_root(YAML::Load(yaml_text), root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in) {
    return ConfigLoadResult::fail("cannot open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  return parse_project_config(buffer.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace gir_model
