// gir_model/sema/patch_hooks.cpp - Hook registry and scoped corrections
#include "gir_model/sema/patch_hooks.hpp"

#include <fmt/format.h>

#include <exception>
#include <utility>

namespace gir_model
{

void PatchHookRegistry::add(PatchHook hook) { hooks_.push_back(std::move(hook)); }

std::vector<const PatchHook *> PatchHookRegistry::hooks_for(const NamespaceKey & key) const
{
  std::vector<const PatchHook *> result;
  for (const auto & hook : hooks_) {
    if (hook.ns == key.name && hook.version == key.version) {
      result.push_back(&hook);
    }
  }
  return result;
}

size_t PatchHookRegistry::run(Namespace & ns, const HookContext & ctx, DiagnosticBag & diags) const
{
  size_t applied = 0;
  for (const PatchHook * hook : hooks_for(ns.key())) {
    try {
      hook->apply(ns, ctx);
      ++applied;
    } catch (const HookError & e) {
      diags
        .report_warning(
          SymbolLocation{ns.package_name(), ns.name()},
          fmt::format("patch hook '{}' skipped: {}", hook->description, e.what()))
        .with_code("H001");
    } catch (const std::exception & e) {
      diags
        .report_warning(
          SymbolLocation{ns.package_name(), ns.name()},
          fmt::format("patch hook '{}' failed: {}", hook->description, e.what()))
        .with_code("H001");
    }
  }
  return applied;
}

BaseClass & expect_class(Namespace & ns, const std::string & name)
{
  BaseClass * cls = ns.find_class(name);
  if (cls == nullptr) {
    throw HookError(fmt::format("class '{}.{}' not found", ns.name(), name));
  }
  return *cls;
}

std::vector<Function *> find_functions(BaseClass & cls, const std::string & name)
{
  std::vector<Function *> result;
  for (auto & fn : cls.members) {
    if (fn.synthesized) {
      continue;
    }
    if (fn.name == name || (fn.kind == FunctionKind::Virtual && "vfunc_" + fn.name == name)) {
      result.push_back(&fn);
    }
  }
  return result;
}

PatchHook make_scoped_correction_hook(ScopedCorrection correction)
{
  PatchHook hook;
  hook.ns = correction.ns;
  hook.version = correction.version;
  hook.description = fmt::format(
    "{}.{}.{}{} -> {}.{}", correction.ns, correction.class_name, correction.member,
    correction.parameter ? "(" + *correction.parameter + ")" : std::string(),
    correction.container, correction.name);

  hook.apply = [c = std::move(correction)](Namespace & ns, const HookContext &) {
    BaseClass & cls = expect_class(ns, c.class_name);
    expect_class(ns, c.container);
    const TypeExpr * target = ns.types().scoped(ns.name(), c.container, c.name);

    if (c.parameter) {
      const auto functions = find_functions(cls, c.member);
      bool found = false;
      for (Function * fn : functions) {
        for (auto & param : fn->parameters) {
          if (param.name == *c.parameter) {
            param.type.resolved = target;
            found = true;
          }
        }
      }
      if (!found) {
        throw HookError(fmt::format(
          "parameter '{}' of '{}.{}' not found", *c.parameter, cls.qualified_name(), c.member));
      }
      return;
    }

    if (Property * prop = cls.find_property(c.member)) {
      prop->type.resolved = target;
      return;
    }
    if (Field * field = cls.find_field(c.member)) {
      field->type.resolved = target;
      return;
    }
    const auto functions = find_functions(cls, c.member);
    if (functions.empty()) {
      throw HookError(fmt::format("member '{}.{}' not found", cls.qualified_name(), c.member));
    }
    for (Function * fn : functions) {
      fn->return_type.resolved = target;
    }
  };
  return hook;
}

}  // namespace gir_model
