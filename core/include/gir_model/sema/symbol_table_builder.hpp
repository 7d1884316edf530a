// gir_model/sema/symbol_table_builder.hpp - Build a Namespace from a raw tree
//
// Runs once per namespace before patch hooks and resolution. Produces the
// symbol table and unresolved slots; no type is resolved here.
//
#pragma once

#include <memory>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/namespace.hpp"
#include "gir_model/model/raw_tree.hpp"

namespace gir_model
{

/**
 * Builds a Namespace (declarations + symbol table) from a RawNamespace.
 *
 * Declaration names are unique within a namespace; a duplicate is reported
 * (S001) and the later definition is skipped.
 */
class SymbolTableBuilder
{
public:
  /**
   * @param diags DiagnosticBag for reporting (nullptr for silent mode)
   */
  explicit SymbolTableBuilder(DiagnosticBag * diags = nullptr);

  /**
   * Build the namespace.
   *
   * @param raw The raw element tree
   * @return The built namespace (never null)
   */
  std::unique_ptr<Namespace> build(const RawNamespace & raw);

  [[nodiscard]] size_t duplicate_count() const noexcept { return duplicate_count_; }

private:
  void add_class(Namespace & ns, const RawClass & raw, ClassKind kind);
  void add_enum(Namespace & ns, const RawEnum & raw);
  void add_function(Namespace & ns, const RawCallable & raw);
  void add_callback(Namespace & ns, const RawCallable & raw);
  void add_constant(Namespace & ns, const RawConstant & raw);
  void add_alias(Namespace & ns, const RawAlias & raw);

  /// Register the name or report a duplicate; returns false when skipped
  bool declare(Namespace & ns, const std::string & name, DeclRef ref);

  DiagnosticBag * diags_;
  size_t duplicate_count_ = 0;
};

/// Convert a raw callable into a model function of the given kind
Function make_function(const RawCallable & raw, FunctionKind kind);

/// Convert a raw callable into a callback declaration
Callback make_callback(const RawCallable & raw);

}  // namespace gir_model
