// gir_model/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "gir_model/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace gir_model
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> package: symbol ===
  print_location(diag.primary_location());

  for (const auto & label : diag.labels) {
    print_label(label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  size_t errors = 0;
  size_t warnings = 0;
  for (const auto & d : diags) {
    if (d.severity == Severity::Error) ++errors;
    if (d.severity == Severity::Warning) ++warnings;
  }

  const std::string text = fmt::format(
    "{} error{}, {} warning{}", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::green) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
      case Severity::Info:
        os_ << rang::fg::cyan << "info";
        break;
      case Severity::Hint:
        os_ << rang::fg::green << "hint";
        break;
    }
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    std::string severity_str;
    switch (diag.severity) {
      case Severity::Error:
        severity_str = "error";
        break;
      case Severity::Warning:
        severity_str = "warning";
        break;
      case Severity::Info:
        severity_str = "info";
        break;
      case Severity::Hint:
        severity_str = "hint";
        break;
    }
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
  }
}

void DiagnosticPrinter::print_location(const SymbolLocation & location)
{
  if (!location.is_valid()) {
    return;
  }
  if (location.symbol.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), location.package);
  } else if (location.package.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), location.symbol);
  } else {
    fmt::print(os_, "{} {}: {}\n", gutter_arrow(), location.package, location.symbol);
  }
}

void DiagnosticPrinter::print_label(const Label & label)
{
  if (label.message.empty()) {
    return;
  }
  if (label.style == LabelStyle::Primary) {
    fmt::print(os_, "{}\n", gutter_pipe());
    fmt::print(os_, "{} {}\n", gutter_pipe(), label.message);
    return;
  }
  const std::string subject = label.location.symbol.empty() ? label.location.package
                                                            : label.location.symbol;
  print_note(subject.empty() ? label.message : fmt::format("{}: {}", subject, label.message));
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace gir_model
