// gir_model/sema/type_resolver.hpp - Raw reference -> TypeExpr resolution
//
// Resolution is an ordered, total function: the first step that matches wins
// and failure degrades to Any with a diagnostic. It never throws.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/model.hpp"
#include "gir_model/model/raw_tree.hpp"
#include "gir_model/model/type_expr.hpp"

namespace gir_model
{

enum class ResolutionStep : uint8_t {
  Fundamental,  ///< built-in name (utf8, gint, none, GType, ...)
  Exact,        ///< explicit Ns.Name (or Container.Name) reference
  Scoped,       ///< compound name matched to Container + nested declaration
  NativeName,   ///< matched through the c_type annotation
  Global,       ///< plain name found in a participating namespace
  Unresolved,   ///< fallback to Any
};

[[nodiscard]] std::string_view resolution_step_name(ResolutionStep step) noexcept;

/**
 * Result of resolving one reference.
 *
 * `note` carries the diagnostic text for the steps that produce one
 * (Scoped over a global, NativeName, cross-namespace Global, Unresolved).
 */
struct Resolution
{
  const TypeExpr * type = nullptr;
  ResolutionStep step = ResolutionStep::Unresolved;
  std::string note;

  [[nodiscard]] bool is_fallback() const noexcept { return step == ResolutionStep::Unresolved; }
};

// ============================================================================
// NativeTypeIndex
// ============================================================================

/**
 * c_type -> declaration index across every participating namespace.
 *
 * Built once after all namespaces are built and patched; read-only afterwards.
 * When two declarations share a c_type, the one from the earlier namespace in
 * load order wins.
 */
class NativeTypeIndex
{
public:
  struct Entry
  {
    std::string ns;
    std::string name;
  };

  NativeTypeIndex() = default;
  explicit NativeTypeIndex(const Model & model);

  [[nodiscard]] const Entry * find(std::string_view c_type) const;
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// Strip qualifiers and pointers: "const GtkWidget*" -> "GtkWidget"
  [[nodiscard]] static std::string normalize(std::string_view c_type);

private:
  std::unordered_map<std::string, Entry> entries_;
};

// ============================================================================
// TypeResolver
// ============================================================================

/**
 * Resolves raw references of one namespace against the whole model.
 *
 * The resolver itself is stateless apart from references to the model and
 * index, so one instance may be shared by worker threads as long as each thread
 * resolves a different namespace (new nodes go to that namespace's arena).
 */
class TypeResolver
{
public:
  TypeResolver(const Model & model, const NativeTypeIndex & index);

  /**
   * Resolve a full reference (name, c_type, type arguments, array depth,
   * nullability) encountered in `ns`.
   */
  Resolution resolve(const RawTypeRef & ref, Namespace & ns) const;

  /**
   * Resolve a bare name (and optional c_type) encountered in `ns`, without any
   * wrapper.
   */
  Resolution resolve_name(std::string_view name, std::string_view c_type, Namespace & ns) const;

  /**
   * Fill every unresolved slot of `ns`. Slots already resolved (by a patch hook)
   * are left untouched.
   *
   * @return number of references that fell back to Any
   */
  size_t resolve_namespace(Namespace & ns, DiagnosticBag & diags) const;

private:
  std::optional<Resolution> try_fundamental(std::string_view name, Namespace & ns) const;
  std::optional<Resolution> try_exact(std::string_view name, Namespace & ns) const;
  std::optional<Resolution> try_scoped(std::string_view name, Namespace & ns) const;
  std::optional<Resolution> try_native(
    std::string_view name, std::string_view c_type, Namespace & ns) const;
  std::optional<Resolution> try_global(std::string_view name, Namespace & ns) const;

  const Model & model_;
  const NativeTypeIndex & index_;
};

}  // namespace gir_model
