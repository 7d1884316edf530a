// tests/unit/basic/test_diagnostic.cpp - Unit tests for DiagnosticBag
//
// Tests the RAII builder and the bag's query helpers.
//

#include <gtest/gtest.h>

#include <utility>

#include "gir_model/basic/diagnostic.hpp"

using namespace gir_model;

// ============================================================================
// Builder
// ============================================================================

TEST(BasicDiagnostic, BuilderCommitsOnDestruction)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_warning(SymbolLocation{"Gtk-4.0", "Gtk.Widget"}, "msg");
    builder.with_code("R001");
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "R001");
  EXPECT_EQ(diags.all()[0].severity, Severity::Warning);
}

TEST(BasicDiagnostic, ChainedBuilder)
{
  DiagnosticBag diags;
  diags.report_error(SymbolLocation{"Gtk-4.0", "Gtk.Widget.x"}, "bad", "here")
    .with_code("C001")
    .with_secondary_label(SymbolLocation{"", "Gtk.Base.x"}, "declared here")
    .with_help("rename it");

  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.code, "C001");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "rename it");

  EXPECT_EQ(d.primary_location().package, "Gtk-4.0");
  EXPECT_EQ(d.primary_location().symbol, "Gtk.Widget.x");
}

TEST(BasicDiagnostic, MovedBuilderCommitsOnce)
{
  DiagnosticBag diags;
  {
    auto first = diags.report_info(SymbolLocation{"A-1.0", ""}, "once");
    auto second = std::move(first);
    second.with_code("C006");
  }
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "C006");
}

// ============================================================================
// Queries
// ============================================================================

TEST(BasicDiagnostic, SeverityQueries)
{
  DiagnosticBag diags;
  diags.report_hint(SymbolLocation{}, "a").with_code("R003");
  EXPECT_FALSE(diags.has_errors());
  EXPECT_FALSE(diags.has_warnings());

  diags.report_warning(SymbolLocation{}, "b").with_code("R001");
  diags.report_warning(SymbolLocation{}, "c").with_code("R001");
  diags.report_error(SymbolLocation{}, "d").with_code("M003");

  EXPECT_TRUE(diags.has_errors());
  EXPECT_TRUE(diags.has_warnings());
  EXPECT_EQ(diags.errors().size(), 1U);
  EXPECT_EQ(diags.warnings().size(), 2U);
  EXPECT_EQ(diags.with_code("R001").size(), 2U);
  EXPECT_TRUE(diags.with_code("X999").empty());
}

TEST(BasicDiagnostic, MergeKeepsOrder)
{
  DiagnosticBag first;
  first.report_warning(SymbolLocation{}, "one").with_code("A");
  DiagnosticBag second;
  second.report_warning(SymbolLocation{}, "two").with_code("B");
  second.report_warning(SymbolLocation{}, "three").with_code("C");

  first.merge(std::move(second));
  ASSERT_EQ(first.size(), 3U);
  EXPECT_EQ(first.all()[0].code, "A");
  EXPECT_EQ(first.all()[1].code, "B");
  EXPECT_EQ(first.all()[2].code, "C");
}

TEST(BasicDiagnostic, LocationValidity)
{
  EXPECT_FALSE(SymbolLocation{}.is_valid());
  EXPECT_TRUE((SymbolLocation{"Gtk-4.0", ""}.is_valid()));
  EXPECT_TRUE((SymbolLocation{"", "Gtk.Widget"}.is_valid()));
}
