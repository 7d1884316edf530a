// gir_model/sema/subtype_checker.hpp - Structural subtype comparison
#pragma once

#include "gir_model/model/model.hpp"
#include "gir_model/sema/class_hierarchy.hpp"

namespace gir_model
{

/**
 * Pure, total comparison of two resolved types.
 *
 * Rules:
 * - A Never parent accepts only Never; a Never child fits only a Never parent.
 * - Any on either side is compatible; a ConflictMarker is opaque and acts as Any.
 * - Identifiers: same declaration, or the child transitively extends/implements
 *   the parent. Scoped identifiers: identity only. Generified types compare
 *   their bases, and their arguments position-wise when the bases are the same.
 * - Arrays/tuples: equal depth/arity, element-wise.
 * - Unions: a union child needs every member compatible; a union parent needs
 *   one compatible member.
 * - A nullable parent accepts both; a non-nullable parent rejects a nullable child.
 * - Generic refs: same name is compatible, otherwise compared through their
 *   constraints (an unconstrained generic acts as Any).
 * - Primitives: equal names only.
 *
 * Parameters and return types are compared in the same direction (child
 * against parent) by callers; there is no contravariance.
 */
class SubtypeChecker
{
public:
  explicit SubtypeChecker(const ClassHierarchy & hierarchy);

  /**
   * @param child_scope Class owning the child type (for generic constraints), may be null
   * @param parent_scope Class owning the parent type, may be null
   */
  [[nodiscard]] bool is_subtype_of(
    const BaseClass * child_scope, const BaseClass * parent_scope, const TypeExpr * child,
    const TypeExpr * parent) const;

  [[nodiscard]] bool is_subtype_of(const TypeExpr * child, const TypeExpr * parent) const
  {
    return is_subtype_of(nullptr, nullptr, child, parent);
  }

private:
  struct Scopes
  {
    const BaseClass * child;
    const BaseClass * parent;
  };

  [[nodiscard]] bool check(const Scopes & scopes, const TypeExpr * child, const TypeExpr * parent)
    const;
  [[nodiscard]] bool check_identifiers(
    const Scopes & scopes, const TypeExpr * child, const TypeExpr * parent) const;
  [[nodiscard]] static const TypeExpr * constraint_of(
    const TypeExpr * generic, const BaseClass * scope);

  const ClassHierarchy & hierarchy_;
};

}  // namespace gir_model
