// gir_model/sema/subtype_checker.cpp - Structural subtype comparison
#include "gir_model/sema/subtype_checker.hpp"

#include <algorithm>

#include "gir_model/model/type_utils.hpp"

namespace gir_model
{

SubtypeChecker::SubtypeChecker(const ClassHierarchy & hierarchy) : hierarchy_(hierarchy) {}

bool SubtypeChecker::is_subtype_of(
  const BaseClass * child_scope, const BaseClass * parent_scope, const TypeExpr * child,
  const TypeExpr * parent) const
{
  return check(Scopes{child_scope, parent_scope}, child, parent);
}

const TypeExpr * SubtypeChecker::constraint_of(const TypeExpr * generic, const BaseClass * scope)
{
  if (generic->inner != nullptr) {
    return generic->inner;
  }
  if (scope != nullptr) {
    if (const GenericParam * param = scope->find_generic(generic->name)) {
      return param->constraint;
    }
  }
  return nullptr;
}

bool SubtypeChecker::check(
  const Scopes & scopes, const TypeExpr * child, const TypeExpr * parent) const
{
  // Unresolved slots behave as Any
  if (child == nullptr) child = TypeContext::any();
  if (parent == nullptr) parent = TypeContext::any();

  // Never wins nothing
  if (parent->is_never() || child->is_never()) {
    return parent->is_never() && child->is_never();
  }

  if (child->is_any() || parent->is_any()) return true;
  if (child->is_conflict_marker() || parent->is_conflict_marker()) return true;

  // Generic references
  if (child->is(TypeExprKind::GenericRef) && parent->is(TypeExprKind::GenericRef)) {
    if (child->name == parent->name) return true;
  }
  if (child->is(TypeExprKind::GenericRef)) {
    const TypeExpr * c = constraint_of(child, scopes.child);
    return c == nullptr || check(scopes, c, parent);
  }
  if (parent->is(TypeExprKind::GenericRef)) {
    const TypeExpr * c = constraint_of(parent, scopes.parent);
    return c == nullptr || check(scopes, child, c);
  }

  // Nullability
  if (parent->is(TypeExprKind::Nullable)) {
    const TypeExpr * inner = child->is(TypeExprKind::Nullable) ? child->inner : child;
    return check(scopes, inner, parent->inner);
  }
  if (child->is(TypeExprKind::Nullable)) return false;

  // Unions
  if (child->is(TypeExprKind::Union)) {
    return std::all_of(child->elements.begin(), child->elements.end(), [&](const TypeExpr * m) {
      return check(scopes, m, parent);
    });
  }
  if (parent->is(TypeExprKind::Union)) {
    return std::any_of(parent->elements.begin(), parent->elements.end(), [&](const TypeExpr * m) {
      return check(scopes, child, m);
    });
  }

  switch (parent->kind) {
    case TypeExprKind::Array:
      return child->is(TypeExprKind::Array) && child->depth == parent->depth &&
             check(scopes, child->inner, parent->inner);

    case TypeExprKind::Tuple: {
      if (!child->is(TypeExprKind::Tuple) || child->elements.size() != parent->elements.size()) {
        return false;
      }
      for (size_t i = 0; i < parent->elements.size(); ++i) {
        if (!check(scopes, child->elements[i], parent->elements[i])) return false;
      }
      return true;
    }

    case TypeExprKind::Primitive:
      return child->is(TypeExprKind::Primitive) && child->name == parent->name;

    case TypeExprKind::ScopedIdentifier:
      return type_equals(child, parent);

    case TypeExprKind::Identifier:
    case TypeExprKind::Generified:
      return check_identifiers(scopes, child, parent);

    case TypeExprKind::Union:
    case TypeExprKind::Nullable:
    case TypeExprKind::GenericRef:
    case TypeExprKind::Any:
    case TypeExprKind::Never:
    case TypeExprKind::ConflictMarker:
      // Handled above
      return false;
  }
  return false;
}

bool SubtypeChecker::check_identifiers(
  const Scopes & scopes, const TypeExpr * child, const TypeExpr * parent) const
{
  const TypeExpr * child_base = child->is(TypeExprKind::Generified) ? child->inner : child;
  const TypeExpr * parent_base = parent->is(TypeExprKind::Generified) ? parent->inner : parent;

  if (!child_base->is_identifier() || !parent_base->is_identifier()) {
    return false;
  }

  if (type_equals(child_base, parent_base)) {
    // Same base: compare type arguments when both sides carry them
    if (child->is(TypeExprKind::Generified) && parent->is(TypeExprKind::Generified)) {
      if (child->elements.size() != parent->elements.size()) return false;
      for (size_t i = 0; i < parent->elements.size(); ++i) {
        if (!check(scopes, child->elements[i], parent->elements[i])) return false;
      }
    }
    return true;
  }

  const BaseClass * child_cls = hierarchy_.class_of(child_base);
  const BaseClass * parent_cls = hierarchy_.class_of(parent_base);
  if (child_cls == nullptr || parent_cls == nullptr) {
    return false;
  }
  return hierarchy_.derives_from(*child_cls, *parent_cls);
}

}  // namespace gir_model
