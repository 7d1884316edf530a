// gir_model/model/namespace.cpp - Declarations and symbol table
#include "gir_model/model/namespace.hpp"

#include <algorithm>
#include <utility>

namespace gir_model
{

std::string_view conflict_resolution_name(ConflictResolution r) noexcept
{
  switch (r) {
    case ConflictResolution::None:
      return "none";
    case ConflictResolution::Wrapped:
      return "wrapped";
    case ConflictResolution::Overloaded:
      return "overloaded";
    case ConflictResolution::Omitted:
      return "omitted";
    case ConflictResolution::EmitOverloads:
      return "emit_overloads";
  }
  return "none";
}

std::string_view function_kind_name(FunctionKind kind) noexcept
{
  switch (kind) {
    case FunctionKind::Method:
      return "method";
    case FunctionKind::Static:
      return "static";
    case FunctionKind::Virtual:
      return "virtual";
    case FunctionKind::Constructor:
      return "constructor";
    case FunctionKind::Global:
      return "function";
  }
  return "method";
}

std::string_view class_kind_name(ClassKind kind) noexcept
{
  switch (kind) {
    case ClassKind::Class:
      return "class";
    case ClassKind::Interface:
      return "interface";
    case ClassKind::Record:
      return "record";
  }
  return "class";
}

std::string_view decl_kind_name(DeclKind kind) noexcept
{
  switch (kind) {
    case DeclKind::Class:
      return "class";
    case DeclKind::Interface:
      return "interface";
    case DeclKind::Record:
      return "record";
    case DeclKind::Enum:
      return "enum";
    case DeclKind::Function:
      return "function";
    case DeclKind::Constant:
      return "constant";
    case DeclKind::Callback:
      return "callback";
    case DeclKind::Alias:
      return "alias";
  }
  return "class";
}

// ============================================================================
// BaseClass
// ============================================================================

namespace
{

template <typename Vec>
auto * find_named(Vec & items, std::string_view name)
{
  auto it = std::find_if(
    items.begin(), items.end(), [name](const auto & item) { return item.name == name; });
  return it == items.end() ? nullptr : &*it;
}

}  // namespace

const Property * BaseClass::find_property(std::string_view member_name) const
{
  return find_named(properties, member_name);
}

const Field * BaseClass::find_field(std::string_view member_name) const
{
  return find_named(fields, member_name);
}

const Callback * BaseClass::find_callback(std::string_view member_name) const
{
  return find_named(callbacks, member_name);
}

Property * BaseClass::find_property(std::string_view member_name)
{
  return find_named(properties, member_name);
}

Field * BaseClass::find_field(std::string_view member_name)
{
  return find_named(fields, member_name);
}

Function * BaseClass::find_member(std::string_view member_name)
{
  return find_named(members, member_name);
}

Callback * BaseClass::find_callback(std::string_view member_name)
{
  return find_named(callbacks, member_name);
}

const GenericParam * BaseClass::find_generic(std::string_view generic_name) const
{
  return find_named(generics, generic_name);
}

// ============================================================================
// Namespace
// ============================================================================

Namespace::Namespace(std::string name, std::string version)
: key_{std::move(name), std::move(version)}, types_(std::make_unique<TypeContext>())
{
}

bool Namespace::declare(std::string_view decl_name, DeclRef ref)
{
  const std::string_view key = types_->intern(decl_name);
  return symbols_.emplace(key, ref).second;
}

std::optional<DeclRef> Namespace::lookup(std::string_view decl_name) const
{
  auto it = symbols_.find(decl_name);
  if (it == symbols_.end()) {
    return std::nullopt;
  }
  return it->second;
}

BaseClass * Namespace::find_class(std::string_view decl_name)
{
  auto ref = lookup(decl_name);
  if (!ref || !ref->is_class_like()) {
    return nullptr;
  }
  return classes[ref->index].get();
}

const BaseClass * Namespace::find_class(std::string_view decl_name) const
{
  auto ref = lookup(decl_name);
  if (!ref || !ref->is_class_like()) {
    return nullptr;
  }
  return classes[ref->index].get();
}

std::string_view Namespace::c_type_of(DeclRef ref) const
{
  switch (ref.kind) {
    case DeclKind::Class:
    case DeclKind::Interface:
    case DeclKind::Record:
      return classes[ref.index]->c_type;
    case DeclKind::Enum:
      return enums[ref.index].c_type;
    case DeclKind::Alias:
      return aliases[ref.index].c_type;
    case DeclKind::Function:
    case DeclKind::Constant:
    case DeclKind::Callback:
      return {};
  }
  return {};
}

}  // namespace gir_model
