// tests/unit/sema/test_patch_hooks.cpp - Unit tests for patch hooks
//
// Tests the hook registry, the built-in Clutter/Meta generic hooks and the
// Gpseq scoped-type corrections.
//

#include <gtest/gtest.h>

#include <memory>
#include <utility>

#include "gir_model/model/type_utils.hpp"
#include "gir_model/sema/builtin_hooks.hpp"
#include "gir_model/sema/patch_hooks.hpp"
#include "gir_model/sema/symbol_table_builder.hpp"
#include "gir_model/sema/type_resolver.hpp"
#include "gir_model/test_support/model_builders.hpp"

using namespace gir_model;
using namespace gir_model::test_support;

namespace
{

RawNamespace raw_clutter(const std::string & version)
{
  RawNamespace ns = raw_namespace("Clutter", version);
  RawClass actor = raw_class("Actor");
  actor.properties.push_back(raw_property("layout-manager", raw_type("LayoutManager")));
  actor.properties.push_back(raw_property("content", raw_type("Content")));
  actor.properties.push_back(raw_property("name", raw_type("utf8")));
  ns.classes.push_back(std::move(actor));
  ns.classes.push_back(raw_class("LayoutManager"));
  RawClass clone = raw_class("Clone", "Actor");
  clone.properties.push_back(raw_property("source", raw_type("Actor")));
  ns.classes.push_back(std::move(clone));
  ns.interfaces.push_back(raw_class("Content"));
  return ns;
}

RawNamespace raw_meta(const std::string & version, bool include_clutter)
{
  RawNamespace ns = raw_namespace("Meta", version);
  if (include_clutter) {
    ns.includes.push_back(RawInclude{"Clutter", version});
  }
  ns.classes.push_back(raw_class("BackgroundActor", "Clutter.Actor"));
  ns.classes.push_back(raw_class("BackgroundContent"));
  return ns;
}

RawNamespace raw_gpseq()
{
  RawNamespace ns = raw_namespace("Gpseq", "1.0");
  RawClass result = raw_class("Result");
  result.callbacks.push_back(raw_callable("MapFunc"));
  result.callbacks.push_back(raw_callable("FlatMapFunc"));
  result.virtual_methods.push_back(
    raw_callable("map", {raw_param("func", raw_type("MapFunc"))}, raw_type("Result")));
  result.virtual_methods.push_back(
    raw_callable("flat_map", {raw_param("func", raw_type("FlatMapFunc"))}, raw_type("Result")));
  ns.classes.push_back(std::move(result));
  ns.callbacks.push_back(raw_callable("MapFunc"));
  ns.callbacks.push_back(raw_callable("FlatMapFunc"));
  return ns;
}

std::unique_ptr<Namespace> build(const RawNamespace & raw)
{
  SymbolTableBuilder builder;
  return builder.build(raw);
}

PatchHookRegistry builtin_registry()
{
  PatchHookRegistry registry;
  register_builtin_hooks(registry);
  return registry;
}

}  // namespace

// ============================================================================
// Registry
// ============================================================================

TEST(SemaPatchHooks, HooksAreKeyedByNamespaceAndVersion)
{
  const PatchHookRegistry registry = builtin_registry();

  const int versions = k_builtin_generics_last_version - k_builtin_generics_first_version + 1;
  EXPECT_EQ(registry.size(), static_cast<size_t>(versions * 2 + 2));

  EXPECT_EQ(registry.hooks_for(NamespaceKey{"Clutter", "12"}).size(), 1U);
  EXPECT_EQ(registry.hooks_for(NamespaceKey{"Clutter", "9"}).size(), 0U);
  EXPECT_EQ(registry.hooks_for(NamespaceKey{"Clutter", "21"}).size(), 0U);
  EXPECT_EQ(registry.hooks_for(NamespaceKey{"Meta", "20"}).size(), 1U);
  EXPECT_EQ(registry.hooks_for(NamespaceKey{"Gpseq", "1.0"}).size(), 2U);
  EXPECT_TRUE(registry.hooks_for(NamespaceKey{"Gtk", "4.0"}).empty());
}

TEST(SemaPatchHooks, HookErrorBecomesDiagnostic)
{
  PatchHookRegistry registry;
  registry.add(PatchHook{"T", "1.0", "always fails", [](Namespace &, const HookContext &) {
                           throw HookError("nope");
                         }});
  registry.add(PatchHook{"T", "1.0", "works", [](Namespace & ns, const HookContext &) {
                           ns.c_prefix = "patched";
                         }});

  auto ns = build(raw_namespace("T"));
  DiagnosticBag diags;
  EXPECT_EQ(registry.run(*ns, HookContext{}, diags), 1U);
  EXPECT_EQ(ns->c_prefix, "patched");

  const auto skipped = diags.with_code("H001");
  ASSERT_EQ(skipped.size(), 1U);
  EXPECT_EQ(skipped[0].severity, Severity::Warning);
  EXPECT_NE(skipped[0].message.find("always fails"), std::string::npos);
  EXPECT_NE(skipped[0].message.find("nope"), std::string::npos);
}

TEST(SemaPatchHooks, UnexpectedHookFailureIsSkipped)
{
  PatchHookRegistry registry;
  registry.add(PatchHook{"T", "1.0", "bad index", [](Namespace & ns, const HookContext &) {
                           (void)ns.classes.at(3);
                         }});
  registry.add(PatchHook{"T", "1.0", "works", [](Namespace & ns, const HookContext &) {
                           ns.c_prefix = "patched";
                         }});

  auto ns = build(raw_namespace("T"));
  DiagnosticBag diags;
  EXPECT_EQ(registry.run(*ns, HookContext{}, diags), 1U);
  EXPECT_EQ(ns->c_prefix, "patched");

  const auto skipped = diags.with_code("H001");
  ASSERT_EQ(skipped.size(), 1U);
  EXPECT_EQ(skipped[0].severity, Severity::Warning);
  EXPECT_NE(skipped[0].message.find("bad index"), std::string::npos);
  EXPECT_FALSE(diags.has_errors());
}

// ============================================================================
// Clutter / Meta generics
// ============================================================================

TEST(SemaPatchHooks, ClutterActorGenerics)
{
  auto ns = build(raw_clutter("12"));
  DiagnosticBag diags;
  EXPECT_EQ(builtin_registry().run(*ns, HookContext{}, diags), 1U);
  EXPECT_TRUE(diags.empty());

  const BaseClass * actor = ns->find_class("Actor");
  ASSERT_EQ(actor->generics.size(), 2U);
  EXPECT_EQ(actor->generics[0].name, "A");
  EXPECT_EQ(to_string(actor->generics[0].constraint), "Clutter.LayoutManager");
  EXPECT_EQ(actor->generics[1].name, "B");
  EXPECT_EQ(to_string(actor->generics[1].constraint), "Clutter.Content");

  const Property * layout = actor->find_property("layout-manager");
  ASSERT_TRUE(layout->type.is_resolved());
  EXPECT_TRUE(layout->type.resolved->is(TypeExprKind::GenericRef));
  EXPECT_EQ(to_string(layout->type.resolved), "A");
  EXPECT_EQ(to_string(actor->find_property("content")->type.resolved), "B");
  EXPECT_FALSE(actor->find_property("name")->type.is_resolved());

  const BaseClass * clone = ns->find_class("Clone");
  ASSERT_EQ(clone->generics.size(), 1U);
  EXPECT_EQ(to_string(clone->generics[0].constraint), "Clutter.Actor");
}

TEST(SemaPatchHooks, ClutterHookIsIdempotent)
{
  auto ns = build(raw_clutter("14"));
  DiagnosticBag diags;
  const PatchHookRegistry registry = builtin_registry();
  (void)registry.run(*ns, HookContext{}, diags);
  (void)registry.run(*ns, HookContext{}, diags);

  EXPECT_EQ(ns->find_class("Actor")->generics.size(), 2U);
  EXPECT_EQ(ns->find_class("Clone")->generics.size(), 1U);
}

TEST(SemaPatchHooks, GenericInferenceDisabled)
{
  auto ns = build(raw_clutter("12"));
  DiagnosticBag diags;
  HookContext ctx;
  ctx.infer_generics = false;
  (void)builtin_registry().run(*ns, ctx, diags);

  EXPECT_TRUE(ns->find_class("Actor")->generics.empty());
  EXPECT_FALSE(ns->find_class("Actor")->find_property("content")->type.is_resolved());
}

TEST(SemaPatchHooks, ClutterWithoutExpectedClassIsSkipped)
{
  RawNamespace raw = raw_namespace("Clutter", "12");
  raw.classes.push_back(raw_class("Actor"));
  auto ns = build(raw);

  DiagnosticBag diags;
  EXPECT_EQ(builtin_registry().run(*ns, HookContext{}, diags), 0U);
  EXPECT_EQ(diags.with_code("H001").size(), 1U);
}

TEST(SemaPatchHooks, MetaBackgroundActor)
{
  auto ns = build(raw_meta("12", true));
  DiagnosticBag diags;
  EXPECT_EQ(builtin_registry().run(*ns, HookContext{}, diags), 1U);

  const BaseClass * actor = ns->find_class("BackgroundActor");
  ASSERT_TRUE(actor->super_type.has_value());
  EXPECT_EQ(
    to_string(actor->super_type->resolved),
    "Clutter.Actor<Clutter.LayoutManager, Meta.BackgroundContent>");
}

TEST(SemaPatchHooks, MetaRequiresClutterInclude)
{
  auto ns = build(raw_meta("12", false));
  DiagnosticBag diags;
  EXPECT_EQ(builtin_registry().run(*ns, HookContext{}, diags), 0U);
  EXPECT_FALSE(ns->find_class("BackgroundActor")->super_type->is_resolved());
  EXPECT_EQ(diags.with_code("H001").size(), 1U);
}

TEST(SemaPatchHooks, ResolutionKeepsHookTypes)
{
  auto tm = std::make_unique<TestModel>();
  tm->model.add(build(raw_clutter("12")));
  tm->model.add(build(raw_meta("12", true)));

  const PatchHookRegistry registry = builtin_registry();
  for (const auto & ns : tm->model) {
    (void)registry.run(*ns, HookContext{}, tm->diags);
  }
  const NativeTypeIndex index(tm->model);
  const TypeResolver resolver(tm->model, index);
  for (const auto & ns : tm->model) {
    (void)resolver.resolve_namespace(*ns, tm->diags);
  }

  EXPECT_TRUE(tm->diags.empty());
  const BaseClass & actor = tm->cls("Clutter", "Actor");
  EXPECT_EQ(to_string(actor.find_property("content")->type.resolved), "B");
  EXPECT_EQ(to_string(actor.find_property("name")->type.resolved), "string");
  EXPECT_EQ(
    to_string(tm->cls("Meta", "BackgroundActor").super_type->resolved),
    "Clutter.Actor<Clutter.LayoutManager, Meta.BackgroundContent>");
}

// ============================================================================
// Scoped corrections
// ============================================================================

TEST(SemaPatchHooks, GpseqCorrections)
{
  auto ns = build(raw_gpseq());
  DiagnosticBag diags;
  EXPECT_EQ(builtin_registry().run(*ns, HookContext{}, diags), 2U);
  EXPECT_TRUE(diags.empty());

  BaseClass * result = ns->find_class("Result");
  const auto map = find_functions(*result, "vfunc_map");
  ASSERT_EQ(map.size(), 1U);
  const TypeExpr * map_type = map[0]->parameters[0].type.resolved;
  ASSERT_NE(map_type, nullptr);
  EXPECT_TRUE(map_type->is(TypeExprKind::ScopedIdentifier));
  EXPECT_EQ(to_string(map_type), "Gpseq.Result.MapFunc");

  const auto flat_map = find_functions(*result, "vfunc_flat_map");
  ASSERT_EQ(flat_map.size(), 1U);
  EXPECT_EQ(
    to_string(flat_map[0]->parameters[0].type.resolved), "Gpseq.Result.FlatMapFunc");
}

TEST(SemaPatchHooks, ConfiguredCorrectionOnProperty)
{
  RawNamespace raw = raw_namespace("Demo", "2.0");
  RawClass holder = raw_class("Holder");
  holder.callbacks.push_back(raw_callable("Handler"));
  holder.properties.push_back(raw_property("handler", raw_type("Handler")));
  raw.classes.push_back(std::move(holder));
  auto ns = build(raw);

  PatchHookRegistry registry;
  registry.add(make_scoped_correction_hook(
    ScopedCorrection{"Demo", "2.0", "Holder", "handler", std::nullopt, "Holder", "Handler"}));

  DiagnosticBag diags;
  EXPECT_EQ(registry.run(*ns, HookContext{}, diags), 1U);
  EXPECT_EQ(
    to_string(ns->find_class("Holder")->find_property("handler")->type.resolved),
    "Demo.Holder.Handler");
}

TEST(SemaPatchHooks, CorrectionForMissingMemberIsSkipped)
{
  auto ns = build(raw_gpseq());
  PatchHookRegistry registry;
  registry.add(make_scoped_correction_hook(
    ScopedCorrection{"Gpseq", "1.0", "Result", "vfunc_filter", "func", "Result", "MapFunc"}));
  registry.add(make_scoped_correction_hook(
    ScopedCorrection{"Gpseq", "1.0", "Missing", "map", std::nullopt, "Result", "MapFunc"}));

  DiagnosticBag diags;
  EXPECT_EQ(registry.run(*ns, HookContext{}, diags), 0U);
  EXPECT_EQ(diags.with_code("H001").size(), 2U);
}
