// gir_model/sema/patch_hooks.hpp - Namespace+version scoped corrections
//
// Hooks run once per namespace, after its symbol table is built and before any
// reference is resolved. A hook only touches its own namespace.
//
#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/namespace.hpp"

namespace gir_model
{

/**
 * Thrown by a hook body that cannot apply (expected declaration absent).
 * The runner reports it (H001) and skips the hook.
 */
class HookError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct HookContext
{
  bool infer_generics = true;
};

struct PatchHook
{
  std::string ns;
  std::string version;
  std::string description;
  std::function<void(Namespace &, const HookContext &)> apply;
};

class PatchHookRegistry
{
public:
  void add(PatchHook hook);

  [[nodiscard]] std::vector<const PatchHook *> hooks_for(const NamespaceKey & key) const;
  [[nodiscard]] size_t size() const noexcept { return hooks_.size(); }
  [[nodiscard]] bool empty() const noexcept { return hooks_.empty(); }

  /**
   * Run every hook registered for `ns` in registration order.
   *
   * @return number of hooks that applied without error
   */
  size_t run(Namespace & ns, const HookContext & ctx, DiagnosticBag & diags) const;

private:
  std::vector<PatchHook> hooks_;
};

// ============================================================================
// Scoped-symbol correction
// ============================================================================

/**
 * Rebind one slot to a ScopedIdentifier `<namespace>.<container>.<name>`.
 *
 * With `parameter` set, the named parameter of every function called `member`
 * is corrected; otherwise the property, field, or function return type named
 * `member` is.
 */
struct ScopedCorrection
{
  std::string ns;
  std::string version;
  std::string class_name;
  std::string member;
  std::optional<std::string> parameter;
  std::string container;
  std::string name;
};

[[nodiscard]] PatchHook make_scoped_correction_hook(ScopedCorrection correction);

/// Find a function by name; virtual functions also answer to "vfunc_<name>"
[[nodiscard]] std::vector<Function *> find_functions(BaseClass & cls, const std::string & name);

/// Class lookup that throws HookError when absent
BaseClass & expect_class(Namespace & ns, const std::string & name);

}  // namespace gir_model
