// gir_model/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their package/symbol subject, secondary notes and
// help text in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "gir_model/basic/diagnostic.hpp"

namespace gir_model
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[R001]: cannot resolve type 'Foo'
 *     --> Gtk-4.0: Gtk.Widget.get_foo
 *         |
 *         | return type
 *         = note: Gdk.Foo: shadowed global
 *         = help: add the declaring namespace to 'modules'
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, in bag order.
   */
  void print_all(const DiagnosticBag & diags);

  /// "2 errors, 5 warnings"
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const SymbolLocation & location);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace gir_model
