// gir_model/model/type_expr.hpp - Resolved type expressions and their arena
//
// TypeExpr nodes are immutable once created and are owned by the TypeContext
// of the namespace that created them. Slots in the model point at nodes; a
// rewrite (hook, conflict annotation) creates a new node and rebinds the slot.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace gir_model
{

// ============================================================================
// Kinds
// ============================================================================

enum class TypeExprKind : uint8_t {
  Identifier,        ///< Ns.Name
  ScopedIdentifier,  ///< Ns.Container.Name
  Array,             ///< element[] (depth times)
  Tuple,             ///< [a, b, ...]
  Union,             ///< a | b (order irrelevant)
  Nullable,          ///< inner | null
  GenericRef,        ///< generic parameter name (with optional constraint)
  Generified,        ///< Base<args...>
  Primitive,         ///< boolean, number, string, void, ...
  Any,
  Never,
  ConflictMarker,  ///< inner type tagged as an unsafe override
};

/**
 * Kind of member conflict. Declaration order is the severity order:
 * a later enumerator is more severe than an earlier one.
 */
enum class ConflictKind : uint8_t {
  None,
  FieldName,
  PropertyName,
  AccessorProperty,
  VfuncSignature,
  FunctionName,
};

[[nodiscard]] std::string_view conflict_kind_name(ConflictKind kind) noexcept;

/// Pick the more severe of two kinds
[[nodiscard]] constexpr ConflictKind most_severe(ConflictKind a, ConflictKind b) noexcept
{
  return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

// ============================================================================
// TypeExpr
// ============================================================================

/**
 * A resolved type expression.
 *
 * Field usage per kind:
 * - Identifier:       ns, name
 * - ScopedIdentifier: ns, container, name
 * - Array:            inner (element), depth
 * - Tuple / Union:    elements
 * - Nullable:         inner
 * - GenericRef:       name, inner (constraint, may be null)
 * - Generified:       inner (base identifier), elements (arguments)
 * - Primitive:        name
 * - ConflictMarker:   inner, conflict
 */
struct TypeExpr
{
  TypeExprKind kind = TypeExprKind::Any;

  std::string_view ns;
  std::string_view container;
  std::string_view name;

  const TypeExpr * inner = nullptr;
  uint32_t depth = 0;
  gsl::span<const TypeExpr * const> elements;

  ConflictKind conflict = ConflictKind::None;

  [[nodiscard]] bool is(TypeExprKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is_any() const noexcept { return kind == TypeExprKind::Any; }
  [[nodiscard]] bool is_never() const noexcept { return kind == TypeExprKind::Never; }
  [[nodiscard]] bool is_identifier() const noexcept { return kind == TypeExprKind::Identifier; }
  [[nodiscard]] bool is_conflict_marker() const noexcept
  {
    return kind == TypeExprKind::ConflictMarker;
  }
};

// ============================================================================
// TypeContext - per-namespace arena for TypeExpr nodes
// ============================================================================

/**
 * Owns every TypeExpr created for one namespace plus the strings they refer to.
 *
 * Not thread-safe; each namespace has its own context and only the task working
 * on that namespace allocates from it. `any()` and `never()` are process-wide
 * singletons shared by every context.
 */
class TypeContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit TypeContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;
  TypeContext(TypeContext &&) = delete;
  TypeContext & operator=(TypeContext &&) = delete;

  // ===========================================================================
  // Singletons
  // ===========================================================================

  [[nodiscard]] static const TypeExpr * any() noexcept;
  [[nodiscard]] static const TypeExpr * never() noexcept;

  // ===========================================================================
  // Factories
  // ===========================================================================

  const TypeExpr * identifier(std::string_view ns, std::string_view name);
  const TypeExpr * scoped(std::string_view ns, std::string_view container, std::string_view name);
  /// depth == 0 returns the element unchanged
  const TypeExpr * array(const TypeExpr * element, uint32_t depth = 1);
  const TypeExpr * tuple(const std::vector<const TypeExpr *> & elements);
  /// Single-member unions collapse to that member
  const TypeExpr * union_of(const std::vector<const TypeExpr *> & members);
  /// Nullable never nests: nullable(nullable(T)) == nullable(T)
  const TypeExpr * nullable(const TypeExpr * inner);
  const TypeExpr * generic_ref(std::string_view name, const TypeExpr * constraint = nullptr);
  const TypeExpr * generified(const TypeExpr * base, const std::vector<const TypeExpr *> & args);
  const TypeExpr * primitive(std::string_view name);

  /**
   * Wrap a type in a ConflictMarker.
   *
   * Markers never nest: wrapping a marker re-wraps its inner type with the
   * more severe of the two kinds (or returns the marker as-is when nothing changes).
   */
  const TypeExpr * conflict_marker(const TypeExpr * inner, ConflictKind kind);

  // ===========================================================================
  // String Interning
  // ===========================================================================

  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return {};
    }
    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
  TypeExpr * create(TypeExprKind kind)
  {
    static_assert(
      std::is_trivially_destructible_v<TypeExpr>,
      "TypeExpr must be trivially destructible to be managed by the arena");
    void * const mem = arena_.allocate(sizeof(TypeExpr), alignof(TypeExpr));
    auto * node = new (mem) TypeExpr();
    node->kind = kind;
    ++node_count_;
    return node;
  }

  gsl::span<const TypeExpr * const> copy_to_arena(const std::vector<const TypeExpr *> & vec)
  {
    if (vec.empty()) {
      return {};
    }
    auto ** ptr = static_cast<const TypeExpr **>(
      arena_.allocate(sizeof(const TypeExpr *) * vec.size(), alignof(const TypeExpr *)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<const TypeExpr * const>(ptr, vec.size());
  }

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
  size_t node_count_ = 0;
};

}  // namespace gir_model
