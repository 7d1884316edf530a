// gir_model/model/type_utils.hpp - Structural helpers over TypeExpr
#pragma once

#include <string>

#include "gir_model/model/type_expr.hpp"

namespace gir_model
{

/**
 * Structural equality.
 *
 * Kind and payload must match. Union members are compared as a multiset,
 * ignoring order. ConflictMarker equality includes its kind and inner type.
 * Null pointers are equal only to null pointers.
 */
[[nodiscard]] bool type_equals(const TypeExpr * a, const TypeExpr * b);

/// Printable form, e.g. "Gtk.Widget", "string[]", "Clutter.Actor<A, B>", "number | null"
[[nodiscard]] std::string to_string(const TypeExpr * type);

/// Remove a ConflictMarker wrapper if present (markers never nest)
[[nodiscard]] inline const TypeExpr * strip_conflict(const TypeExpr * type) noexcept
{
  if (type != nullptr && type->kind == TypeExprKind::ConflictMarker) {
    return type->inner;
  }
  return type;
}

/// Qualified identity of an Identifier/ScopedIdentifier, e.g. "Gtk.Widget"
[[nodiscard]] std::string qualified_name(const TypeExpr * type);

}  // namespace gir_model
