// gir_model/registry/module_registry.cpp - Module discovery and load ordering
#include "gir_model/registry/module_registry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <system_error>
#include <unordered_map>

namespace gir_model
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view k_module_suffix = ".gir.json";

struct RequestParts
{
  std::string ns;
  std::string version;  ///< "*" when the request names no version
};

RequestParts split_request(std::string_view request)
{
  const auto dash = request.rfind('-');
  if (dash == std::string_view::npos) {
    return {std::string(request), "*"};
  }
  return {std::string(request.substr(0, dash)), std::string(request.substr(dash + 1))};
}

bool has_wildcard(std::string_view pattern)
{
  return pattern.find_first_of("*?") != std::string_view::npos;
}

/// "4" names 4.0 and 4.1, but not 40.0
bool version_prefix_match(std::string_view prefix, std::string_view version)
{
  if (version == prefix) return true;
  return version.size() > prefix.size() && version.substr(0, prefix.size()) == prefix &&
         version[prefix.size()] == '.';
}

bool version_matches(std::string_view pattern, std::string_view version)
{
  if (has_wildcard(pattern)) {
    return glob_match(pattern, version);
  }
  return version_prefix_match(pattern, version);
}

std::vector<std::string_view> split_version(std::string_view v)
{
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= v.size()) {
    const auto dot = v.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(v.substr(start));
      break;
    }
    parts.push_back(v.substr(start, dot - start));
    start = dot + 1;
  }
  return parts;
}

bool all_digits(std::string_view s)
{
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view strip_leading_zeros(std::string_view s)
{
  while (s.size() > 1 && s.front() == '0') {
    s.remove_prefix(1);
  }
  return s;
}

SymbolLocation module_location(const std::string & package)
{
  return SymbolLocation{package, ""};
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

bool glob_match(std::string_view pattern, std::string_view text) noexcept
{
  size_t p = 0;
  size_t t = 0;
  size_t star = std::string_view::npos;
  size_t resume = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

int compare_versions(std::string_view a, std::string_view b) noexcept
{
  const auto pa = split_version(a);
  const auto pb = split_version(b);
  const size_t n = std::max(pa.size(), pb.size());

  for (size_t i = 0; i < n; ++i) {
    const std::string_view ca = i < pa.size() ? pa[i] : "0";
    const std::string_view cb = i < pb.size() ? pb[i] : "0";
    if (all_digits(ca) && all_digits(cb)) {
      const auto na = strip_leading_zeros(ca);
      const auto nb = strip_leading_zeros(cb);
      if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
      if (const int c = na.compare(nb); c != 0) return c < 0 ? -1 : 1;
    } else if (const int c = ca.compare(cb); c != 0) {
      return c < 0 ? -1 : 1;
    }
  }
  return 0;
}

std::optional<ModuleFile> parse_module_file_name(const fs::path & path)
{
  const std::string file_name = path.filename().string();
  if (
    file_name.size() <= k_module_suffix.size() ||
    file_name.compare(
      file_name.size() - k_module_suffix.size(), k_module_suffix.size(), k_module_suffix) != 0) {
    return std::nullopt;
  }

  const std::string stem = file_name.substr(0, file_name.size() - k_module_suffix.size());
  const auto dash = stem.rfind('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 == stem.size()) {
    return std::nullopt;
  }
  return ModuleFile{stem.substr(0, dash), stem.substr(dash + 1), path};
}

std::string_view group_state_name(GroupState state) noexcept
{
  switch (state) {
    case GroupState::Discovered:
      return "discovered";
    case GroupState::Grouped:
      return "grouped";
    case GroupState::Resolved:
      return "resolved";
    case GroupState::Conflicting:
      return "conflicting";
    case GroupState::Failed:
      return "failed";
  }
  return "discovered";
}

// ============================================================================
// ModuleRegistry
// ============================================================================

ModuleRegistry::ModuleRegistry(
  std::vector<fs::path> search_dirs, std::vector<std::string> ignore, VersionPolicy policy,
  DiagnosticBag * diags)
: search_dirs_(std::move(search_dirs)), ignore_(std::move(ignore)), policy_(policy), diags_(diags)
{
}

bool ModuleRegistry::is_ignored(std::string_view package_name) const
{
  for (const auto & pattern : ignore_) {
    const bool has_version = pattern.find('-') != std::string::npos;
    if (glob_match(has_version ? pattern : pattern + "-*", package_name)) {
      return true;
    }
  }
  return false;
}

size_t ModuleRegistry::discover()
{
  discovered_.clear();
  scanned_ = true;

  std::set<std::string> seen;
  for (const auto & dir : search_dirs_) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      if (diags_ != nullptr) {
        diags_
          ->report_warning(
            SymbolLocation{}, fmt::format("search directory '{}' does not exist", dir.string()))
          .with_code("M001");
      }
      continue;
    }

    std::vector<ModuleFile> found;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code file_ec;
      if (!it->is_regular_file(file_ec)) {
        continue;
      }
      if (auto module = parse_module_file_name(it->path())) {
        found.push_back(std::move(*module));
      }
    }
    std::sort(found.begin(), found.end(), [](const ModuleFile & a, const ModuleFile & b) {
      return a.package_name() < b.package_name();
    });

    for (auto & module : found) {
      const std::string package = module.package_name();
      if (is_ignored(package) || !seen.insert(package).second) {
        continue;
      }
      discovered_.push_back(std::move(module));
    }
  }
  return discovered_.size();
}

std::vector<ModuleFile> ModuleRegistry::match(std::string_view request) const
{
  const RequestParts parts = split_request(request);
  std::vector<ModuleFile> result;
  for (const auto & module : discovered_) {
    if (glob_match(parts.ns, module.ns) && version_matches(parts.version, module.version)) {
      result.push_back(module);
    }
  }
  return result;
}

std::optional<ModuleFile> ModuleRegistry::find_discovered(
  std::string_view ns, std::string_view version) const
{
  for (const auto & module : discovered_) {
    if (module.ns == ns && module.version == version) {
      return module;
    }
  }
  return std::nullopt;
}

std::optional<ModuleFile> ModuleRegistry::find_highest(std::string_view ns) const
{
  std::optional<ModuleFile> best;
  for (const auto & module : discovered_) {
    if (module.ns == ns && (!best || compare_versions(module.version, best->version) > 0)) {
      best = module;
    }
  }
  return best;
}

void ModuleRegistry::apply_policy(
  ModuleGroup & group, const std::vector<std::string> & requests) const
{
  if (group.modules.size() == 1) {
    group.state = GroupState::Resolved;
    group.selected = 0;
    return;
  }

  switch (policy_) {
    case VersionPolicy::Report:
      break;
    case VersionPolicy::Highest:
      group.state = GroupState::Resolved;
      group.selected = group.modules.size() - 1;
      return;
    case VersionPolicy::Prefix: {
      std::set<size_t> named;
      for (const auto & request : requests) {
        const RequestParts parts = split_request(request);
        if (has_wildcard(parts.version) || !glob_match(parts.ns, group.ns)) {
          continue;
        }
        for (size_t i = 0; i < group.modules.size(); ++i) {
          if (version_prefix_match(parts.version, group.modules[i].version)) {
            named.insert(i);
          }
        }
      }
      if (named.size() == 1) {
        group.state = GroupState::Resolved;
        group.selected = *named.begin();
        return;
      }
      break;
    }
  }

  group.state = GroupState::Conflicting;
  group.has_conflict = true;
}

std::vector<ModuleGroup> ModuleRegistry::group(const std::vector<std::string> & requests) const
{
  std::map<std::string, ModuleGroup> by_ns;
  std::vector<ModuleGroup> unmatched;

  for (const auto & request : requests) {
    const auto matches = match(request);
    if (matches.empty()) {
      ModuleGroup failed;
      failed.ns = request;
      failed.state = GroupState::Failed;
      unmatched.push_back(std::move(failed));
      continue;
    }
    for (const auto & module : matches) {
      ModuleGroup & g = by_ns[module.ns];
      g.ns = module.ns;
      g.state = GroupState::Grouped;
      const bool present = std::any_of(g.modules.begin(), g.modules.end(), [&](const auto & m) {
        return m.version == module.version;
      });
      if (!present) {
        g.modules.push_back(module);
      }
    }
  }

  std::vector<ModuleGroup> groups;
  groups.reserve(by_ns.size() + unmatched.size());
  for (auto & [ns, g] : by_ns) {
    std::sort(g.modules.begin(), g.modules.end(), [](const ModuleFile & a, const ModuleFile & b) {
      return compare_versions(a.version, b.version) < 0;
    });
    apply_policy(g, requests);
    groups.push_back(std::move(g));
  }
  for (auto & g : unmatched) {
    groups.push_back(std::move(g));
  }
  return groups;
}

RegistryResult ModuleRegistry::resolve(
  const std::vector<std::string> & requests, const RawTreeReader & reader)
{
  if (!scanned_) {
    discover();
  }

  DiagnosticBag local;
  DiagnosticBag & diags = diags_ != nullptr ? *diags_ : local;

  RegistryResult result;
  result.groups = group(requests);

  // Unmatched requests
  for (const auto & g : result.groups) {
    if (g.state == GroupState::Failed && g.modules.empty()) {
      diags
        .report_error(
          SymbolLocation{}, fmt::format("no module matches '{}'", g.ns), "requested here")
        .with_code("M002");
      result.failed.push_back(g.ns);
    }
  }

  struct Node
  {
    ModuleFile file;
    RawNamespace tree;
    std::vector<std::string> deps;  ///< namespace names
    size_t group_index = 0;
    bool failed = false;
  };
  std::map<std::string, Node> nodes;  // keyed by namespace name
  std::unordered_map<std::string, size_t> group_of;
  std::deque<std::string> queue;

  for (size_t i = 0; i < result.groups.size(); ++i) {
    const ModuleGroup & g = result.groups[i];
    if (g.modules.empty()) continue;
    group_of.emplace(g.ns, i);
    if (g.state == GroupState::Resolved) {
      queue.push_back(g.ns);
    }
  }

  auto fail_node = [&](Node & node) {
    node.failed = true;
    result.groups[node.group_index].state = GroupState::Failed;
    result.failed.push_back(node.file.package_name());
  };

  // Read raw trees, pulling in dependencies as they are found
  while (!queue.empty()) {
    const std::string ns = queue.front();
    queue.pop_front();
    if (nodes.count(ns) != 0) continue;

    const size_t gi = group_of.at(ns);
    Node & node = nodes[ns];
    node.group_index = gi;
    node.file = *result.groups[gi].selected_module();
    const std::string package = node.file.package_name();

    RawTreeLoadResult loaded = reader.read(node.file.path);
    if (!loaded.success) {
      diags
        .report_error(
          module_location(package), fmt::format("cannot read '{}': {}", package, loaded.error))
        .with_code("M004");
      fail_node(node);
      continue;
    }
    if (loaded.tree.name != node.file.ns || loaded.tree.version != node.file.version) {
      diags
        .report_error(
          module_location(package),
          fmt::format(
            "'{}' declares namespace '{}-{}'", node.file.path.filename().string(),
            loaded.tree.name, loaded.tree.version))
        .with_code("M004");
      fail_node(node);
      continue;
    }
    node.tree = std::move(loaded.tree);

    for (const auto & inc : node.tree.includes) {
      if (inc.name == ns) continue;
      if (std::find(node.deps.begin(), node.deps.end(), inc.name) != node.deps.end()) continue;
      node.deps.push_back(inc.name);

      auto git = group_of.find(inc.name);
      if (git != group_of.end()) {
        ModuleGroup & dep_group = result.groups[git->second];
        if (dep_group.state != GroupState::Conflicting) {
          continue;
        }
        // An explicit dependency version settles a conflicting group
        const auto exact = std::find_if(
          dep_group.modules.begin(), dep_group.modules.end(),
          [&](const ModuleFile & m) { return m.version == inc.version; });
        if (exact != dep_group.modules.end()) {
          dep_group.selected = static_cast<size_t>(exact - dep_group.modules.begin());
          dep_group.state = GroupState::Resolved;
          dep_group.has_conflict = false;
          queue.push_back(inc.name);
        }
        continue;
      }

      std::optional<ModuleFile> dep = find_discovered(inc.name, inc.version);
      if (!dep) {
        dep = find_highest(inc.name);
      }
      if (!dep) {
        diags
          .report_error(
            module_location(package),
            fmt::format("dependency '{}-{}' of '{}' not found", inc.name, inc.version, package))
          .with_code("M005");
        continue;
      }

      ModuleGroup auto_group;
      auto_group.ns = dep->ns;
      auto_group.modules.push_back(std::move(*dep));
      auto_group.state = GroupState::Resolved;
      auto_group.selected = 0;
      auto_group.auto_loaded = true;
      group_of.emplace(inc.name, result.groups.size());
      result.groups.push_back(std::move(auto_group));
      queue.push_back(inc.name);
    }
  }

  // Groups a dependency did not settle stay rejected
  for (const auto & g : result.groups) {
    if (g.state != GroupState::Conflicting) continue;
    std::vector<std::string> versions;
    for (const auto & m : g.modules) versions.push_back(m.package_name());
    diags
      .report_error(
        SymbolLocation{g.ns, ""},
        fmt::format(
          "namespace '{}' is available in several versions: {}", g.ns, fmt::join(versions, ", ")))
      .with_code("M003")
      .with_help("request an explicit version, or set version_policy to 'highest' or 'prefix'");
  }

  // Failure propagation to a fixed point
  for (auto & [ns, node] : nodes) {
    if (node.failed) continue;
    for (const auto & dep : node.deps) {
      if (nodes.count(dep) == 0) {
        const ModuleGroup * dep_group =
          group_of.count(dep) != 0 ? &result.groups[group_of.at(dep)] : nullptr;
        if (dep_group != nullptr && dep_group->state == GroupState::Conflicting) {
          diags
            .report_error(
              module_location(node.file.package_name()),
              fmt::format(
                "'{}' depends on '{}', which has conflicting versions", node.file.package_name(),
                dep))
            .with_code("M005");
        }
        fail_node(node);
        break;
      }
    }
  }
  for (bool changed = true; changed;) {
    changed = false;
    for (auto & [ns, node] : nodes) {
      if (node.failed) continue;
      for (const auto & dep : node.deps) {
        const Node & dep_node = nodes.at(dep);
        if (dep_node.failed) {
          diags
            .report_error(
              module_location(node.file.package_name()),
              fmt::format(
                "'{}' depends on '{}', which failed to load", node.file.package_name(),
                dep_node.file.package_name()))
            .with_code("M006");
          fail_node(node);
          changed = true;
          break;
        }
      }
    }
  }

  // Kahn's algorithm, alphabetical among ready modules
  std::map<std::string, size_t> in_degree;
  std::map<std::string, std::vector<std::string>> dependents;
  for (const auto & [ns, node] : nodes) {
    if (node.failed) continue;
    in_degree.emplace(ns, node.deps.size());
    for (const auto & dep : node.deps) {
      dependents[dep].push_back(ns);
    }
  }

  std::set<std::string> ready;
  for (const auto & [ns, degree] : in_degree) {
    if (degree == 0) ready.insert(ns);
  }

  std::vector<std::string> order;
  while (!ready.empty()) {
    const std::string ns = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(ns);
    for (const auto & dependent : dependents[ns]) {
      if (--in_degree.at(dependent) == 0) {
        ready.insert(dependent);
      }
    }
  }

  if (order.size() != in_degree.size()) {
    std::vector<std::string> cyclic;
    for (const auto & [ns, degree] : in_degree) {
      if (degree > 0) cyclic.push_back(nodes.at(ns).file.package_name());
    }
    diags
      .report_error(
        SymbolLocation{},
        fmt::format("dependency cycle between {}", fmt::join(cyclic, ", ")))
      .with_code("M007")
      .with_help("the run cannot continue");
    result.success = false;
    return result;
  }

  result.load_order.reserve(order.size());
  for (const auto & ns : order) {
    Node & node = nodes.at(ns);
    result.load_order.push_back(LoadedModule{std::move(node.file), std::move(node.tree)});
  }
  result.success = true;
  return result;
}

}  // namespace gir_model
