// gir_model/model/namespace.hpp - Declarations and per-namespace symbol table
//
// A Namespace is the built (and later resolved/annotated) form of one
// RawNamespace. Declarations own std::string names; TypeExpr slots point into
// the namespace's TypeContext arena.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gir_model/model/raw_tree.hpp"
#include "gir_model/model/type_expr.hpp"

namespace gir_model
{

// ============================================================================
// Identity
// ============================================================================

struct NamespaceKey
{
  std::string name;
  std::string version;

  /// "<name>-<version>", e.g. "Gtk-4.0"
  [[nodiscard]] std::string package_name() const { return name + "-" + version; }

  bool operator==(const NamespaceKey & other) const
  {
    return name == other.name && version == other.version;
  }
  bool operator!=(const NamespaceKey & other) const { return !(*this == other); }
  bool operator<(const NamespaceKey & other) const
  {
    return name != other.name ? name < other.name : version < other.version;
  }
};

// ============================================================================
// Slots and annotations
// ============================================================================

/**
 * A typed slot: the raw reference plus its resolved type.
 *
 * `resolved` is null until the resolver (or a patch hook) fills it. A slot
 * filled by a hook is left alone by the resolver.
 */
struct TypeRef
{
  RawTypeRef raw;
  const TypeExpr * resolved = nullptr;

  [[nodiscard]] bool is_resolved() const noexcept { return resolved != nullptr; }
};

enum class ConflictResolution : uint8_t {
  None,
  Wrapped,        ///< type wrapped in a ConflictMarker
  Overloaded,     ///< kept, plus a synthesized never-overload
  Omitted,        ///< dropped from rendering
  EmitOverloads,  ///< virtual signature tag, type untouched
};

[[nodiscard]] std::string_view conflict_resolution_name(ConflictResolution r) noexcept;

struct ConflictAnnotation
{
  ConflictKind kind = ConflictKind::None;
  ConflictResolution resolution = ConflictResolution::None;
  std::string ancestor;  ///< qualified name of the ancestor the member collided with

  [[nodiscard]] bool is_conflicted() const noexcept { return kind != ConflictKind::None; }
};

// ============================================================================
// Members
// ============================================================================

enum class FunctionKind : uint8_t {
  Method,
  Static,
  Virtual,
  Constructor,
  Global,
};

[[nodiscard]] std::string_view function_kind_name(FunctionKind kind) noexcept;

struct Parameter
{
  std::string name;
  TypeRef type;
  Direction direction = Direction::In;
  bool varargs = false;
};

struct Function
{
  std::string name;
  FunctionKind kind = FunctionKind::Method;
  std::vector<Parameter> parameters;         ///< in and inout parameters
  std::vector<Parameter> output_parameters;  ///< out and inout parameters
  TypeRef return_type;
  bool introspectable = true;

  bool synthesized = false;     ///< created by the conflict detector
  bool emit_overloads = false;  ///< virtual signature conflict tag
  bool omitted = false;
  std::string note;  ///< e.g. "conflicted with Gtk.Widget.get_style"
  ConflictAnnotation conflict;
};

struct Property
{
  std::string name;
  TypeRef type;
  bool readable = true;
  bool writable = false;
  bool construct_only = false;
  ConflictAnnotation conflict;
};

struct Field
{
  std::string name;
  TypeRef type;
  bool writable = true;
  ConflictAnnotation conflict;
};

struct Callback
{
  std::string name;
  std::vector<Parameter> parameters;
  TypeRef return_type;
};

struct GenericParam
{
  std::string name;
  const TypeExpr * constraint = nullptr;
  const TypeExpr * default_type = nullptr;
};

// ============================================================================
// Declarations
// ============================================================================

enum class ClassKind : uint8_t {
  Class,
  Interface,
  Record,
};

[[nodiscard]] std::string_view class_kind_name(ClassKind kind) noexcept;

/**
 * Class, interface or record.
 *
 * One tagged record with shared accessors; `super_type` is only ever set for
 * classes and records.
 */
struct BaseClass
{
  ClassKind kind = ClassKind::Class;
  std::string name;
  std::string namespace_name;
  std::string c_type;

  std::optional<TypeRef> super_type;
  std::vector<TypeRef> interfaces;
  std::vector<GenericParam> generics;

  std::vector<Function> constructors;
  std::vector<Function> members;  ///< methods, static and virtual functions
  std::vector<Property> properties;
  std::vector<Field> fields;
  std::vector<Callback> callbacks;

  bool has_vfunc_signature_conflicts = false;

  [[nodiscard]] std::string qualified_name() const { return namespace_name + "." + name; }

  [[nodiscard]] bool is_class() const noexcept { return kind == ClassKind::Class; }
  [[nodiscard]] bool is_interface() const noexcept { return kind == ClassKind::Interface; }
  [[nodiscard]] bool is_record() const noexcept { return kind == ClassKind::Record; }

  [[nodiscard]] const Property * find_property(std::string_view member_name) const;
  [[nodiscard]] const Field * find_field(std::string_view member_name) const;
  [[nodiscard]] const Callback * find_callback(std::string_view member_name) const;
  [[nodiscard]] Property * find_property(std::string_view member_name);
  [[nodiscard]] Field * find_field(std::string_view member_name);
  [[nodiscard]] Function * find_member(std::string_view member_name);
  [[nodiscard]] Callback * find_callback(std::string_view member_name);
  [[nodiscard]] const GenericParam * find_generic(std::string_view generic_name) const;

  /// True when `nested_name` names a declaration owned by this class (callbacks)
  [[nodiscard]] bool owns_nested(std::string_view nested_name) const
  {
    return find_callback(nested_name) != nullptr;
  }
};

struct EnumMember
{
  std::string name;
  int64_t value = 0;
};

struct Enum
{
  std::string name;
  std::string c_type;
  bool is_bitfield = false;
  std::vector<EnumMember> members;
};

struct Constant
{
  std::string name;
  TypeRef type;
  std::string value;
};

struct Alias
{
  std::string name;
  std::string c_type;
  TypeRef target;
};

// ============================================================================
// Symbol table
// ============================================================================

enum class DeclKind : uint8_t {
  Class,
  Interface,
  Record,
  Enum,
  Function,
  Constant,
  Callback,
  Alias,
};

[[nodiscard]] std::string_view decl_kind_name(DeclKind kind) noexcept;

struct DeclRef
{
  DeclKind kind = DeclKind::Class;
  size_t index = 0;  ///< index into the namespace's storage for that kind

  [[nodiscard]] bool is_class_like() const noexcept
  {
    return kind == DeclKind::Class || kind == DeclKind::Interface || kind == DeclKind::Record;
  }
};

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Namespace
// ============================================================================

/**
 * Symbol table plus storage for one (namespace, version).
 *
 * Keys of the symbol table are interned in the namespace's TypeContext, so
 * they live as long as the namespace.
 */
class Namespace
{
public:
  Namespace(std::string name, std::string version);

  Namespace(const Namespace &) = delete;
  Namespace & operator=(const Namespace &) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return key_.name; }
  [[nodiscard]] const std::string & version() const noexcept { return key_.version; }
  [[nodiscard]] const NamespaceKey & key() const noexcept { return key_; }
  [[nodiscard]] std::string package_name() const { return key_.package_name(); }

  [[nodiscard]] TypeContext & types() noexcept { return *types_; }
  [[nodiscard]] const TypeContext & types() const noexcept { return *types_; }

  // ===========================================================================
  // Symbol table
  // ===========================================================================

  /**
   * Register a declaration name.
   *
   * @return false if the name is already declared (the caller reports and skips)
   */
  bool declare(std::string_view decl_name, DeclRef ref);

  [[nodiscard]] std::optional<DeclRef> lookup(std::string_view decl_name) const;
  [[nodiscard]] bool contains(std::string_view decl_name) const
  {
    return lookup(decl_name).has_value();
  }
  [[nodiscard]] size_t symbol_count() const noexcept { return symbols_.size(); }

  [[nodiscard]] BaseClass * find_class(std::string_view decl_name);
  [[nodiscard]] const BaseClass * find_class(std::string_view decl_name) const;

  /// c_type of a declaration, empty if it has none
  [[nodiscard]] std::string_view c_type_of(DeclRef ref) const;

  // ===========================================================================
  // Storage
  // ===========================================================================

  std::string c_prefix;
  std::vector<NamespaceKey> includes;

  std::vector<std::unique_ptr<BaseClass>> classes;  ///< classes, interfaces and records
  std::vector<Enum> enums;
  std::vector<Function> functions;
  std::vector<Constant> constants;
  std::vector<Callback> callbacks;
  std::vector<Alias> aliases;

private:
  NamespaceKey key_;
  std::unique_ptr<TypeContext> types_;
  std::unordered_map<std::string_view, DeclRef, StringViewHash, StringViewEqual> symbols_;
};

}  // namespace gir_model
