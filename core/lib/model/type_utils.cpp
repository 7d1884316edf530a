// gir_model/model/type_utils.cpp - Structural equality and printing
#include "gir_model/model/type_utils.hpp"

#include <fmt/format.h>

#include <vector>

namespace gir_model
{

namespace
{

bool unordered_equals(
  gsl::span<const TypeExpr * const> a, gsl::span<const TypeExpr * const> b)
{
  if (a.size() != b.size()) {
    return false;
  }
  std::vector<bool> used(b.size(), false);
  for (const TypeExpr * lhs : a) {
    bool found = false;
    for (size_t i = 0; i < b.size(); ++i) {
      if (!used[i] && type_equals(lhs, b[i])) {
        used[i] = true;
        found = true;
        break;
      }
    }
    if (!found) {
      return false;
    }
  }
  return true;
}

bool ordered_equals(gsl::span<const TypeExpr * const> a, gsl::span<const TypeExpr * const> b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!type_equals(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

std::string join(gsl::span<const TypeExpr * const> elements, std::string_view sep)
{
  std::string out;
  bool first = true;
  for (const TypeExpr * e : elements) {
    if (!first) {
      out += sep;
    }
    first = false;
    out += to_string(e);
  }
  return out;
}

}  // namespace

bool type_equals(const TypeExpr * a, const TypeExpr * b)
{
  if (a == b) {
    return true;
  }
  if (a == nullptr || b == nullptr || a->kind != b->kind) {
    return false;
  }

  switch (a->kind) {
    case TypeExprKind::Identifier:
      return a->ns == b->ns && a->name == b->name;
    case TypeExprKind::ScopedIdentifier:
      return a->ns == b->ns && a->container == b->container && a->name == b->name;
    case TypeExprKind::Array:
      return a->depth == b->depth && type_equals(a->inner, b->inner);
    case TypeExprKind::Tuple:
      return ordered_equals(a->elements, b->elements);
    case TypeExprKind::Union:
      return unordered_equals(a->elements, b->elements);
    case TypeExprKind::Nullable:
      return type_equals(a->inner, b->inner);
    case TypeExprKind::GenericRef:
      return a->name == b->name && type_equals(a->inner, b->inner);
    case TypeExprKind::Generified:
      return type_equals(a->inner, b->inner) && ordered_equals(a->elements, b->elements);
    case TypeExprKind::Primitive:
      return a->name == b->name;
    case TypeExprKind::Any:
    case TypeExprKind::Never:
      return true;
    case TypeExprKind::ConflictMarker:
      return a->conflict == b->conflict && type_equals(a->inner, b->inner);
  }
  return false;
}

std::string to_string(const TypeExpr * type)
{
  if (type == nullptr) {
    return "<unresolved>";
  }

  switch (type->kind) {
    case TypeExprKind::Identifier:
      return fmt::format("{}.{}", type->ns, type->name);
    case TypeExprKind::ScopedIdentifier:
      return fmt::format("{}.{}.{}", type->ns, type->container, type->name);
    case TypeExprKind::Array: {
      std::string out = to_string(type->inner);
      const bool needs_parens = type->inner->kind == TypeExprKind::Union ||
                                type->inner->kind == TypeExprKind::Nullable;
      if (needs_parens) {
        out = fmt::format("({})", out);
      }
      for (uint32_t i = 0; i < type->depth; ++i) {
        out += "[]";
      }
      return out;
    }
    case TypeExprKind::Tuple:
      return fmt::format("[{}]", join(type->elements, ", "));
    case TypeExprKind::Union:
      return join(type->elements, " | ");
    case TypeExprKind::Nullable:
      return fmt::format("{} | null", to_string(type->inner));
    case TypeExprKind::GenericRef:
      return std::string(type->name);
    case TypeExprKind::Generified:
      return fmt::format("{}<{}>", to_string(type->inner), join(type->elements, ", "));
    case TypeExprKind::Primitive:
      return std::string(type->name);
    case TypeExprKind::Any:
      return "any";
    case TypeExprKind::Never:
      return "never";
    case TypeExprKind::ConflictMarker:
      return fmt::format("{} /* {} */", to_string(type->inner), conflict_kind_name(type->conflict));
  }
  return "<unknown>";
}

std::string qualified_name(const TypeExpr * type)
{
  if (type == nullptr) {
    return {};
  }
  switch (type->kind) {
    case TypeExprKind::Identifier:
      return fmt::format("{}.{}", type->ns, type->name);
    case TypeExprKind::ScopedIdentifier:
      return fmt::format("{}.{}.{}", type->ns, type->container, type->name);
    case TypeExprKind::Generified:
      return qualified_name(type->inner);
    default:
      return {};
  }
}

}  // namespace gir_model
