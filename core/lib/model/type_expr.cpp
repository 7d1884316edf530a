// gir_model/model/type_expr.cpp - TypeContext factories
#include "gir_model/model/type_expr.hpp"

#include "gir_model/model/type_utils.hpp"

namespace gir_model
{

std::string_view conflict_kind_name(ConflictKind kind) noexcept
{
  switch (kind) {
    case ConflictKind::None:
      return "NONE";
    case ConflictKind::FieldName:
      return "FIELD_NAME_CONFLICT";
    case ConflictKind::PropertyName:
      return "PROPERTY_NAME_CONFLICT";
    case ConflictKind::AccessorProperty:
      return "ACCESSOR_PROPERTY_CONFLICT";
    case ConflictKind::VfuncSignature:
      return "VFUNC_SIGNATURE_CONFLICT";
    case ConflictKind::FunctionName:
      return "FUNCTION_NAME_CONFLICT";
  }
  return "NONE";
}

const TypeExpr * TypeContext::any() noexcept
{
  static const TypeExpr k_any{TypeExprKind::Any};
  return &k_any;
}

const TypeExpr * TypeContext::never() noexcept
{
  static const TypeExpr k_never{TypeExprKind::Never};
  return &k_never;
}

const TypeExpr * TypeContext::identifier(std::string_view ns, std::string_view name)
{
  TypeExpr * node = create(TypeExprKind::Identifier);
  node->ns = intern(ns);
  node->name = intern(name);
  return node;
}

const TypeExpr * TypeContext::scoped(
  std::string_view ns, std::string_view container, std::string_view name)
{
  TypeExpr * node = create(TypeExprKind::ScopedIdentifier);
  node->ns = intern(ns);
  node->container = intern(container);
  node->name = intern(name);
  return node;
}

const TypeExpr * TypeContext::array(const TypeExpr * element, uint32_t depth)
{
  if (depth == 0) {
    return element;
  }
  // Flatten Array(Array(T, n), m) into Array(T, n + m)
  if (element->kind == TypeExprKind::Array) {
    depth += element->depth;
    element = element->inner;
  }
  TypeExpr * node = create(TypeExprKind::Array);
  node->inner = element;
  node->depth = depth;
  return node;
}

const TypeExpr * TypeContext::tuple(const std::vector<const TypeExpr *> & elements)
{
  TypeExpr * node = create(TypeExprKind::Tuple);
  node->elements = copy_to_arena(elements);
  return node;
}

const TypeExpr * TypeContext::union_of(const std::vector<const TypeExpr *> & members)
{
  if (members.size() == 1) {
    return members.front();
  }
  TypeExpr * node = create(TypeExprKind::Union);
  node->elements = copy_to_arena(members);
  return node;
}

const TypeExpr * TypeContext::nullable(const TypeExpr * inner)
{
  if (inner->kind == TypeExprKind::Nullable) {
    return inner;
  }
  TypeExpr * node = create(TypeExprKind::Nullable);
  node->inner = inner;
  return node;
}

const TypeExpr * TypeContext::generic_ref(std::string_view name, const TypeExpr * constraint)
{
  TypeExpr * node = create(TypeExprKind::GenericRef);
  node->name = intern(name);
  node->inner = constraint;
  return node;
}

const TypeExpr * TypeContext::generified(
  const TypeExpr * base, const std::vector<const TypeExpr *> & args)
{
  if (args.empty()) {
    return base;
  }
  TypeExpr * node = create(TypeExprKind::Generified);
  node->inner = base;
  node->elements = copy_to_arena(args);
  return node;
}

const TypeExpr * TypeContext::primitive(std::string_view name)
{
  TypeExpr * node = create(TypeExprKind::Primitive);
  node->name = intern(name);
  return node;
}

const TypeExpr * TypeContext::conflict_marker(const TypeExpr * inner, ConflictKind kind)
{
  if (inner->kind == TypeExprKind::ConflictMarker) {
    const ConflictKind merged = most_severe(inner->conflict, kind);
    if (merged == inner->conflict) {
      return inner;
    }
    inner = inner->inner;
    kind = merged;
  }
  TypeExpr * node = create(TypeExprKind::ConflictMarker);
  node->inner = inner;
  node->conflict = kind;
  return node;
}

}  // namespace gir_model
