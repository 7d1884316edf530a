// gir_model/sema/symbol_table_builder.cpp - Namespace construction
#include "gir_model/sema/symbol_table_builder.hpp"

#include <fmt/format.h>

#include <utility>

namespace gir_model
{

namespace
{

TypeRef make_ref(const RawTypeRef & raw) { return TypeRef{raw, nullptr}; }

Parameter make_parameter(const RawParameter & raw)
{
  Parameter p;
  p.name = raw.name;
  p.type = make_ref(raw.type);
  p.direction = raw.direction;
  p.varargs = raw.varargs;
  return p;
}

DeclKind decl_kind_for(ClassKind kind)
{
  switch (kind) {
    case ClassKind::Class:
      return DeclKind::Class;
    case ClassKind::Interface:
      return DeclKind::Interface;
    case ClassKind::Record:
      return DeclKind::Record;
  }
  return DeclKind::Class;
}

}  // namespace

Function make_function(const RawCallable & raw, FunctionKind kind)
{
  Function fn;
  fn.name = raw.name;
  fn.kind = kind;
  fn.introspectable = raw.introspectable;
  fn.return_type = make_ref(raw.return_type);
  for (const auto & param : raw.parameters) {
    switch (param.direction) {
      case Direction::In:
        fn.parameters.push_back(make_parameter(param));
        break;
      case Direction::Out:
        fn.output_parameters.push_back(make_parameter(param));
        break;
      case Direction::InOut:
        fn.parameters.push_back(make_parameter(param));
        fn.output_parameters.push_back(make_parameter(param));
        break;
    }
  }
  return fn;
}

Callback make_callback(const RawCallable & raw)
{
  Callback cb;
  cb.name = raw.name;
  cb.return_type = make_ref(raw.return_type);
  for (const auto & param : raw.parameters) {
    cb.parameters.push_back(make_parameter(param));
  }
  return cb;
}

SymbolTableBuilder::SymbolTableBuilder(DiagnosticBag * diags) : diags_(diags) {}

std::unique_ptr<Namespace> SymbolTableBuilder::build(const RawNamespace & raw)
{
  auto ns = std::make_unique<Namespace>(raw.name, raw.version);
  ns->c_prefix = raw.c_prefix;
  for (const auto & inc : raw.includes) {
    ns->includes.push_back(NamespaceKey{inc.name, inc.version});
  }

  for (const auto & cls : raw.classes) {
    add_class(*ns, cls, ClassKind::Class);
  }
  for (const auto & iface : raw.interfaces) {
    add_class(*ns, iface, ClassKind::Interface);
  }
  for (const auto & rec : raw.records) {
    add_class(*ns, rec, ClassKind::Record);
  }
  for (const auto & en : raw.enums) {
    add_enum(*ns, en);
  }
  for (const auto & fn : raw.functions) {
    add_function(*ns, fn);
  }
  for (const auto & cb : raw.callbacks) {
    add_callback(*ns, cb);
  }
  for (const auto & c : raw.constants) {
    add_constant(*ns, c);
  }
  for (const auto & a : raw.aliases) {
    add_alias(*ns, a);
  }

  return ns;
}

bool SymbolTableBuilder::declare(Namespace & ns, const std::string & name, DeclRef ref)
{
  if (ns.declare(name, ref)) {
    return true;
  }

  ++duplicate_count_;
  if (diags_ != nullptr) {
    const auto existing = ns.lookup(name);
    diags_
      ->report_warning(
        SymbolLocation{ns.package_name(), ns.name() + "." + name},
        fmt::format("duplicate declaration '{}'", name),
        fmt::format("{} skipped", decl_kind_name(ref.kind)))
      .with_code("S001")
      .with_help(fmt::format(
        "the first definition ({}) is kept",
        existing ? decl_kind_name(existing->kind) : std::string_view("unknown")));
  }
  return false;
}

void SymbolTableBuilder::add_class(Namespace & ns, const RawClass & raw, ClassKind kind)
{
  if (!declare(ns, raw.name, DeclRef{decl_kind_for(kind), ns.classes.size()})) {
    return;
  }

  auto cls = std::make_unique<BaseClass>();
  cls->kind = kind;
  cls->name = raw.name;
  cls->namespace_name = ns.name();
  cls->c_type = raw.c_type;

  // Interfaces never carry a super type; their parents are prerequisites
  if (!raw.parent.empty() && kind != ClassKind::Interface) {
    RawTypeRef parent;
    parent.name = raw.parent;
    cls->super_type = make_ref(parent);
  }
  for (const auto & iface : raw.implements) {
    RawTypeRef ref;
    ref.name = iface;
    cls->interfaces.push_back(make_ref(ref));
  }
  if (!raw.parent.empty() && kind == ClassKind::Interface) {
    RawTypeRef ref;
    ref.name = raw.parent;
    cls->interfaces.push_back(make_ref(ref));
  }

  for (const auto & ctor : raw.constructors) {
    cls->constructors.push_back(make_function(ctor, FunctionKind::Constructor));
  }
  for (const auto & m : raw.methods) {
    cls->members.push_back(make_function(m, FunctionKind::Method));
  }
  for (const auto & m : raw.virtual_methods) {
    cls->members.push_back(make_function(m, FunctionKind::Virtual));
  }
  for (const auto & m : raw.functions) {
    cls->members.push_back(make_function(m, FunctionKind::Static));
  }
  for (const auto & p : raw.properties) {
    Property prop;
    prop.name = p.name;
    prop.type = make_ref(p.type);
    prop.readable = p.readable;
    prop.writable = p.writable;
    prop.construct_only = p.construct_only;
    cls->properties.push_back(std::move(prop));
  }
  for (const auto & f : raw.fields) {
    Field field;
    field.name = f.name;
    field.type = make_ref(f.type);
    field.writable = f.writable;
    cls->fields.push_back(std::move(field));
  }
  for (const auto & cb : raw.callbacks) {
    cls->callbacks.push_back(make_callback(cb));
  }

  ns.classes.push_back(std::move(cls));
}

void SymbolTableBuilder::add_enum(Namespace & ns, const RawEnum & raw)
{
  if (!declare(ns, raw.name, DeclRef{DeclKind::Enum, ns.enums.size()})) {
    return;
  }
  Enum en;
  en.name = raw.name;
  en.c_type = raw.c_type;
  en.is_bitfield = raw.is_bitfield;
  for (const auto & m : raw.members) {
    en.members.push_back(EnumMember{m.name, m.value});
  }
  ns.enums.push_back(std::move(en));
}

void SymbolTableBuilder::add_function(Namespace & ns, const RawCallable & raw)
{
  if (!declare(ns, raw.name, DeclRef{DeclKind::Function, ns.functions.size()})) {
    return;
  }
  ns.functions.push_back(make_function(raw, FunctionKind::Global));
}

void SymbolTableBuilder::add_callback(Namespace & ns, const RawCallable & raw)
{
  if (!declare(ns, raw.name, DeclRef{DeclKind::Callback, ns.callbacks.size()})) {
    return;
  }
  ns.callbacks.push_back(make_callback(raw));
}

void SymbolTableBuilder::add_constant(Namespace & ns, const RawConstant & raw)
{
  if (!declare(ns, raw.name, DeclRef{DeclKind::Constant, ns.constants.size()})) {
    return;
  }
  ns.constants.push_back(Constant{raw.name, make_ref(raw.type), raw.value});
}

void SymbolTableBuilder::add_alias(Namespace & ns, const RawAlias & raw)
{
  if (!declare(ns, raw.name, DeclRef{DeclKind::Alias, ns.aliases.size()})) {
    return;
  }
  ns.aliases.push_back(Alias{raw.name, raw.c_type, make_ref(raw.target)});
}

}  // namespace gir_model
