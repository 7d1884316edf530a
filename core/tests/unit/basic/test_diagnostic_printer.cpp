// tests/unit/basic/test_diagnostic_printer.cpp - Unit tests for DiagnosticPrinter
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/basic/diagnostic_printer.hpp"

using namespace gir_model;

TEST(BasicDiagnosticPrinter, PlainWarning)
{
  DiagnosticBag diags;
  diags
    .report_warning(
      SymbolLocation{"Gtk-4.0", "Gtk.Widget.foo"}, "unresolved type reference 'Foo'",
      "typed as any")
    .with_code("R001");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  const std::string expected =
    "warning[R001]: unresolved type reference 'Foo'\n"
    "  --> Gtk-4.0: Gtk.Widget.foo\n"
    "      |\n"
    "      | typed as any\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(BasicDiagnosticPrinter, SecondaryLabelAndHelp)
{
  DiagnosticBag diags;
  diags.report_error(SymbolLocation{"Gio-2.0", ""}, "namespace 'Gio' is broken")
    .with_code("M003")
    .with_secondary_label(SymbolLocation{"", "Gio.File.read"}, "declared here")
    .with_help("pick one");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(diags.all()[0]);

  const std::string expected =
    "error[M003]: namespace 'Gio' is broken\n"
    "  --> Gio-2.0\n"
    "      = note: Gio.File.read: declared here\n"
    "      = help: pick one\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(BasicDiagnosticPrinter, NoLocationNoCode)
{
  DiagnosticBag diags;
  diags.report_info(SymbolLocation{}, "nothing to do");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  EXPECT_EQ(out.str(), "info: nothing to do\n\n");
}

TEST(BasicDiagnosticPrinter, Summary)
{
  DiagnosticBag diags;
  diags.report_error(SymbolLocation{}, "a");
  diags.report_warning(SymbolLocation{}, "b");
  diags.report_warning(SymbolLocation{}, "c");
  diags.report_hint(SymbolLocation{}, "d");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_summary(diags);
  EXPECT_EQ(out.str(), "1 error, 2 warnings\n");

  std::ostringstream empty_out;
  DiagnosticPrinter empty_printer(empty_out, false);
  empty_printer.print_summary(DiagnosticBag{});
  EXPECT_EQ(empty_out.str(), "0 errors, 0 warnings\n");
}
