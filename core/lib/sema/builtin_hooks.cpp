// gir_model/sema/builtin_hooks.cpp - Clutter/Meta generics and Gpseq corrections
#include "gir_model/sema/builtin_hooks.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>
#include <string>

namespace gir_model
{

namespace
{

void add_generic(BaseClass & cls, const std::string & name, const TypeExpr * bound)
{
  if (cls.find_generic(name) != nullptr) {
    return;
  }
  cls.generics.push_back(GenericParam{name, bound, bound});
}

void set_property_types(
  BaseClass & cls, std::initializer_list<std::string_view> names, const TypeExpr * type)
{
  for (auto & prop : cls.properties) {
    if (std::find(names.begin(), names.end(), prop.name) != names.end()) {
      prop.type.resolved = type;
    }
  }
}

void apply_clutter_generics(Namespace & ns, const HookContext & ctx)
{
  if (!ctx.infer_generics) {
    return;
  }

  BaseClass & actor = expect_class(ns, "Actor");
  expect_class(ns, "Content");
  expect_class(ns, "LayoutManager");
  BaseClass & clone = expect_class(ns, "Clone");

  TypeContext & types = ns.types();
  const TypeExpr * layout_manager = types.identifier(ns.name(), "LayoutManager");
  const TypeExpr * content = types.identifier(ns.name(), "Content");
  const TypeExpr * actor_type = types.identifier(ns.name(), "Actor");

  add_generic(actor, "A", layout_manager);
  add_generic(actor, "B", content);
  set_property_types(
    actor, {"layout_manager", "layout-manager", "layoutManager"},
    types.generic_ref("A", layout_manager));
  set_property_types(actor, {"content"}, types.generic_ref("B", content));

  add_generic(clone, "A", actor_type);
  set_property_types(clone, {"source"}, types.generic_ref("A", actor_type));
}

void apply_meta_generics(Namespace & ns, const HookContext & ctx)
{
  if (!ctx.infer_generics) {
    return;
  }

  const bool imports_clutter = std::any_of(
    ns.includes.begin(), ns.includes.end(),
    [](const NamespaceKey & inc) { return inc.name == "Clutter"; });
  if (!imports_clutter) {
    throw HookError(fmt::format("'{}' does not include Clutter", ns.package_name()));
  }
  expect_class(ns, "BackgroundContent");
  BaseClass & background_actor = expect_class(ns, "BackgroundActor");
  if (!background_actor.super_type) {
    return;
  }

  TypeRef & super = *background_actor.super_type;
  if (super.resolved != nullptr && super.resolved->is(TypeExprKind::Generified)) {
    return;
  }

  // Resolution has not run yet: split the raw "Ns.Name" (or local "Name") reference
  std::string parent_ns = ns.name();
  std::string parent_name = super.raw.name;
  const auto dot = parent_name.find('.');
  if (dot != std::string::npos) {
    parent_ns = parent_name.substr(0, dot);
    parent_name = parent_name.substr(dot + 1);
  }

  TypeContext & types = ns.types();
  super.resolved = types.generified(
    types.identifier(parent_ns, parent_name),
    {types.identifier("Clutter", "LayoutManager"),
     types.identifier(ns.name(), "BackgroundContent")});
}

}  // namespace

void register_builtin_hooks(PatchHookRegistry & registry)
{
  for (int v = k_builtin_generics_first_version; v <= k_builtin_generics_last_version; ++v) {
    const std::string version = std::to_string(v);
    registry.add(PatchHook{
      "Clutter", version, fmt::format("Clutter-{} actor generics", version),
      apply_clutter_generics});
    registry.add(PatchHook{
      "Meta", version, fmt::format("Meta-{} background actor generics", version),
      apply_meta_generics});
  }

  registry.add(make_scoped_correction_hook(
    ScopedCorrection{"Gpseq", "1.0", "Result", "vfunc_flat_map", "func", "Result", "FlatMapFunc"}));
  registry.add(make_scoped_correction_hook(
    ScopedCorrection{"Gpseq", "1.0", "Result", "vfunc_map", "func", "Result", "MapFunc"}));
}

}  // namespace gir_model
