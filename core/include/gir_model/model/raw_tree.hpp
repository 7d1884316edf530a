// gir_model/model/raw_tree.hpp - Raw element tree produced by the upstream parser
//
// One RawNamespace per (namespace, version). Nothing here is resolved: type
// references are plain names plus the optional native type-name annotation.
//
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gir_model
{

enum class Direction : uint8_t {
  In,
  Out,
  InOut,
};

struct RawTypeRef
{
  std::string name;    ///< "Widget", "Gtk.Widget", "utf8", ...
  std::string c_type;  ///< native type-name annotation, e.g. "GtkWidget*"
  uint32_t array_depth = 0;
  bool nullable = false;
  std::vector<RawTypeRef> type_arguments;

  [[nodiscard]] bool empty() const noexcept { return name.empty() && c_type.empty(); }
};

struct RawParameter
{
  std::string name;
  RawTypeRef type;
  Direction direction = Direction::In;
  bool varargs = false;
};

struct RawCallable
{
  std::string name;
  std::vector<RawParameter> parameters;
  RawTypeRef return_type;
  bool introspectable = true;
};

struct RawProperty
{
  std::string name;
  RawTypeRef type;
  bool readable = true;
  bool writable = false;
  bool construct_only = false;
};

struct RawField
{
  std::string name;
  RawTypeRef type;
  bool writable = true;
};

struct RawClass
{
  std::string name;
  std::string c_type;
  std::string parent;                   ///< empty when no super type
  std::vector<std::string> implements;  ///< implemented interfaces / prerequisites
  std::vector<RawCallable> constructors;
  std::vector<RawCallable> methods;
  std::vector<RawCallable> virtual_methods;
  std::vector<RawCallable> functions;  ///< static functions
  std::vector<RawProperty> properties;
  std::vector<RawField> fields;
  std::vector<RawCallable> callbacks;
};

struct RawEnumMember
{
  std::string name;
  int64_t value = 0;
};

struct RawEnum
{
  std::string name;
  std::string c_type;
  bool is_bitfield = false;
  std::vector<RawEnumMember> members;
};

struct RawConstant
{
  std::string name;
  RawTypeRef type;
  std::string value;
};

struct RawAlias
{
  std::string name;
  std::string c_type;
  RawTypeRef target;
};

struct RawInclude
{
  std::string name;
  std::string version;
};

struct RawNamespace
{
  std::string name;
  std::string version;
  std::string c_prefix;
  std::vector<RawInclude> includes;

  std::vector<RawClass> classes;
  std::vector<RawClass> interfaces;
  std::vector<RawClass> records;
  std::vector<RawEnum> enums;
  std::vector<RawCallable> functions;
  std::vector<RawCallable> callbacks;
  std::vector<RawConstant> constants;
  std::vector<RawAlias> aliases;
};

}  // namespace gir_model
