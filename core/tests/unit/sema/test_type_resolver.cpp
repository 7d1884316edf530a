// tests/unit/sema/test_type_resolver.cpp - Unit tests for TypeResolver
//
// Tests the ordered resolution steps (fundamental, exact, scoped, native name,
// global, unresolved) and the diagnostics emitted by the namespace walk.
//

#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "gir_model/model/type_utils.hpp"
#include "gir_model/sema/type_resolver.hpp"
#include "gir_model/test_support/model_builders.hpp"

using namespace gir_model;
using namespace gir_model::test_support;

namespace
{

RawNamespace raw_gtk()
{
  RawNamespace ns = raw_namespace("Gtk", "4.0");
  ns.includes.push_back(RawInclude{"GObject", "2.0"});
  RawClass widget = raw_class("Widget", "GObject.Object");
  widget.c_type = "GtkWidget";
  ns.classes.push_back(std::move(widget));
  return ns;
}

RawNamespace raw_gpseq()
{
  RawNamespace ns = raw_namespace("Gpseq", "1.0");
  RawClass result = raw_class("Result");
  result.callbacks.push_back(raw_callable("MapFunc"));
  ns.classes.push_back(std::move(result));
  // Same-named global declaration the scoped lookup must not pick
  ns.callbacks.push_back(raw_callable("ResultMapFunc"));
  return ns;
}

struct ResolverFixture
{
  std::unique_ptr<TestModel> tm;
  NativeTypeIndex index;

  explicit ResolverFixture(std::vector<RawNamespace> trees)
  : tm(build_resolved(trees)), index(tm->model)
  {
  }

  Resolution resolve(const RawTypeRef & ref, const char * ns)
  {
    TypeResolver resolver(tm->model, index);
    return resolver.resolve(ref, tm->ns(ns));
  }
};

}  // namespace

// ============================================================================
// Fundamental names
// ============================================================================

TEST(SemaTypeResolver, FundamentalNames)
{
  ResolverFixture f({raw_gobject(), raw_gtk()});

  auto utf8 = f.resolve(raw_type("utf8"), "Gtk");
  EXPECT_EQ(utf8.step, ResolutionStep::Fundamental);
  EXPECT_EQ(to_string(utf8.type), "string");

  EXPECT_EQ(to_string(f.resolve(raw_type("gint"), "Gtk").type), "number");
  EXPECT_EQ(to_string(f.resolve(raw_type("gboolean"), "Gtk").type), "boolean");
  EXPECT_EQ(to_string(f.resolve(raw_type("none"), "Gtk").type), "void");
  EXPECT_EQ(to_string(f.resolve(raw_type(""), "Gtk").type), "void");

  auto ptr = f.resolve(raw_type("gpointer"), "Gtk");
  EXPECT_EQ(ptr.step, ResolutionStep::Fundamental);
  EXPECT_TRUE(ptr.type->is_any());

  EXPECT_EQ(to_string(f.resolve(raw_type("GType"), "Gtk").type), "GObject.GType");
}

TEST(SemaTypeResolver, ByteArray)
{
  ResolverFixture f({raw_gtk()});
  RawTypeRef bytes = raw_type("guint8");
  bytes.array_depth = 1;
  EXPECT_EQ(to_string(f.resolve(bytes, "Gtk").type), "Uint8Array");

  bytes.array_depth = 2;
  EXPECT_EQ(to_string(f.resolve(bytes, "Gtk").type), "Uint8Array[]");
}

TEST(SemaTypeResolver, Wrappers)
{
  ResolverFixture f({raw_gtk()});
  RawTypeRef ref = raw_type("Widget");
  ref.array_depth = 1;
  ref.nullable = true;
  EXPECT_EQ(to_string(f.resolve(ref, "Gtk").type), "Gtk.Widget[] | null");

  RawTypeRef list = raw_type("Gtk.Widget");
  list.type_arguments.push_back(raw_type("utf8"));
  EXPECT_EQ(to_string(f.resolve(list, "Gtk").type), "Gtk.Widget<string>");
}

// ============================================================================
// Exact and global references
// ============================================================================

TEST(SemaTypeResolver, ExactReference)
{
  ResolverFixture f({raw_gobject(), raw_gtk()});

  auto res = f.resolve(raw_type("GObject.Object"), "Gtk");
  EXPECT_EQ(res.step, ResolutionStep::Exact);
  EXPECT_EQ(to_string(res.type), "GObject.Object");
  EXPECT_TRUE(res.note.empty());

  auto local = f.resolve(raw_type("Gtk.Widget"), "Gtk");
  EXPECT_EQ(local.step, ResolutionStep::Exact);
  EXPECT_EQ(to_string(local.type), "Gtk.Widget");
}

TEST(SemaTypeResolver, ExactNestedReference)
{
  ResolverFixture f({raw_gpseq()});

  auto qualified = f.resolve(raw_type("Gpseq.Result.MapFunc"), "Gpseq");
  EXPECT_EQ(qualified.step, ResolutionStep::Exact);
  EXPECT_TRUE(qualified.type->is(TypeExprKind::ScopedIdentifier));
  EXPECT_EQ(to_string(qualified.type), "Gpseq.Result.MapFunc");

  auto relative = f.resolve(raw_type("Result.MapFunc"), "Gpseq");
  EXPECT_EQ(relative.step, ResolutionStep::Exact);
  EXPECT_EQ(to_string(relative.type), "Gpseq.Result.MapFunc");
}

TEST(SemaTypeResolver, LocalGlobal)
{
  ResolverFixture f({raw_gtk()});
  auto res = f.resolve(raw_type("Widget"), "Gtk");
  EXPECT_EQ(res.step, ResolutionStep::Global);
  EXPECT_EQ(to_string(res.type), "Gtk.Widget");
  EXPECT_TRUE(res.note.empty());
}

TEST(SemaTypeResolver, CrossNamespaceGlobal)
{
  ResolverFixture f({raw_gobject(), raw_gtk()});
  auto res = f.resolve(raw_type("Object"), "Gtk");
  EXPECT_EQ(res.step, ResolutionStep::Global);
  EXPECT_EQ(to_string(res.type), "GObject.Object");
  EXPECT_FALSE(res.note.empty());
}

// ============================================================================
// Scoped over global
// ============================================================================

TEST(SemaTypeResolver, ScopedBeatsGlobal)
{
  ResolverFixture f({raw_gpseq()});

  auto res = f.resolve(raw_type("ResultMapFunc"), "Gpseq");
  EXPECT_EQ(res.step, ResolutionStep::Scoped);
  ASSERT_TRUE(res.type->is(TypeExprKind::ScopedIdentifier));
  EXPECT_EQ(res.type->container, "Result");
  EXPECT_EQ(res.type->name, "MapFunc");
  EXPECT_NE(res.note.find("over the global declaration"), std::string::npos);

  // Explicit qualification selects the global one
  auto global = f.resolve(raw_type("Gpseq.ResultMapFunc"), "Gpseq");
  EXPECT_EQ(global.step, ResolutionStep::Exact);
  EXPECT_TRUE(global.type->is_identifier());
}

// ============================================================================
// Native type names
// ============================================================================

TEST(SemaTypeResolver, NativeNameNormalization)
{
  EXPECT_EQ(NativeTypeIndex::normalize("GtkWidget*"), "GtkWidget");
  EXPECT_EQ(NativeTypeIndex::normalize("const GtkWidget *"), "GtkWidget");
  EXPECT_EQ(NativeTypeIndex::normalize("gchar**"), "gchar");
  EXPECT_EQ(NativeTypeIndex::normalize("unsigned long"), "unsignedlong");
}

TEST(SemaTypeResolver, NativeNameFallback)
{
  ResolverFixture f({raw_gobject(), raw_gtk()});

  auto renamed = f.resolve(raw_type("OldWidget", "GtkWidget*"), "Gtk");
  EXPECT_EQ(renamed.step, ResolutionStep::NativeName);
  EXPECT_EQ(to_string(renamed.type), "Gtk.Widget");
  EXPECT_FALSE(renamed.note.empty());

  // Same declaration by both routes: no note
  auto same = f.resolve(raw_type("Widget", "GtkWidget*"), "Gtk");
  EXPECT_EQ(same.step, ResolutionStep::NativeName);
  EXPECT_TRUE(same.note.empty());
}

TEST(SemaTypeResolver, NativeNameFirstNamespaceWins)
{
  RawNamespace first = raw_namespace("A", "1.0");
  RawClass a = raw_class("Thing");
  a.c_type = "SharedThing";
  first.classes.push_back(std::move(a));

  RawNamespace second = raw_namespace("B", "1.0");
  RawClass b = raw_class("Other");
  b.c_type = "SharedThing";
  second.classes.push_back(std::move(b));

  ResolverFixture f({first, second});
  auto res = f.resolve(raw_type("Missing", "SharedThing"), "B");
  EXPECT_EQ(to_string(res.type), "A.Thing");
}

// ============================================================================
// Fallback
// ============================================================================

TEST(SemaTypeResolver, UnresolvedIsAny)
{
  ResolverFixture f({raw_gtk()});
  auto res = f.resolve(raw_type("Nowhere.Thing", "NowhereThing*"), "Gtk");
  EXPECT_TRUE(res.is_fallback());
  EXPECT_TRUE(res.type->is_any());
  EXPECT_NE(res.note.find("Nowhere.Thing"), std::string::npos);
}

// ============================================================================
// Namespace walk
// ============================================================================

TEST(SemaTypeResolver, NamespaceWalkDiagnostics)
{
  RawNamespace gtk = raw_gtk();
  RawClass window = raw_class("Window", "Widget");
  window.properties.push_back(raw_property("child", raw_type("Missing")));
  window.properties.push_back(raw_property("parent", raw_type("Object")));
  window.fields.push_back(raw_field("legacy", raw_type("Legacy", "GtkWidget*")));
  gtk.classes.push_back(std::move(window));

  RawNamespace gpseq = raw_gpseq();
  gpseq.functions.push_back(
    raw_callable("map", {raw_param("func", raw_type("ResultMapFunc"))}));

  auto tm = build_resolved({raw_gobject(), gtk, gpseq});

  const auto unresolved = tm->diags.with_code("R001");
  ASSERT_EQ(unresolved.size(), 1U);
  EXPECT_EQ(unresolved[0].severity, Severity::Warning);
  EXPECT_EQ(unresolved[0].primary_location().package, "Gtk-4.0");
  EXPECT_EQ(unresolved[0].primary_location().symbol, "Gtk.Window.child");

  const auto scoped = tm->diags.with_code("R002");
  ASSERT_EQ(scoped.size(), 1U);
  EXPECT_EQ(scoped[0].severity, Severity::Warning);
  EXPECT_EQ(scoped[0].primary_location().symbol, "Gpseq.map");

  const auto native = tm->diags.with_code("R003");
  ASSERT_EQ(native.size(), 1U);
  EXPECT_EQ(native[0].severity, Severity::Hint);

  const auto cross = tm->diags.with_code("R004");
  ASSERT_EQ(cross.size(), 1U);
  EXPECT_EQ(cross[0].severity, Severity::Hint);

  // Every slot is filled, including the fallback one
  const BaseClass & win = tm->cls("Gtk", "Window");
  EXPECT_TRUE(win.find_property("child")->type.is_resolved());
  EXPECT_TRUE(win.find_property("child")->type.resolved->is_any());
  EXPECT_EQ(to_string(win.super_type->resolved), "Gtk.Widget");
}

TEST(SemaTypeResolver, PreResolvedSlotsAreKept)
{
  RawNamespace gtk = raw_gtk();
  auto tm = build_resolved({gtk});
  BaseClass & widget = tm->cls("Gtk", "Widget");

  // GObject is absent: the super type fell back to Any
  ASSERT_TRUE(widget.super_type.has_value());
  EXPECT_TRUE(widget.super_type->resolved->is_any());

  const TypeExpr * patched = tm->ns("Gtk").types().primitive("string");
  widget.super_type->resolved = patched;

  const NativeTypeIndex index(tm->model);
  const TypeResolver resolver(tm->model, index);
  DiagnosticBag diags;
  EXPECT_EQ(resolver.resolve_namespace(tm->ns("Gtk"), diags), 0U);
  EXPECT_EQ(widget.super_type->resolved, patched);
}
