// gir_model/test_support/model_builders.hpp - helpers for unit tests
//
// Small builders for raw trees plus a build-and-resolve pipeline that stops
// before conflict analysis, so tests can drive the detector themselves.
//
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/model.hpp"
#include "gir_model/model/raw_tree.hpp"
#include "gir_model/sema/symbol_table_builder.hpp"
#include "gir_model/sema/type_resolver.hpp"

namespace gir_model::test_support
{

[[nodiscard]] inline RawTypeRef raw_type(std::string name, std::string c_type = "")
{
  RawTypeRef ref;
  ref.name = std::move(name);
  ref.c_type = std::move(c_type);
  return ref;
}

[[nodiscard]] inline RawParameter raw_param(
  std::string name, RawTypeRef type, Direction direction = Direction::In)
{
  RawParameter p;
  p.name = std::move(name);
  p.type = std::move(type);
  p.direction = direction;
  return p;
}

[[nodiscard]] inline RawCallable raw_callable(
  std::string name, std::vector<RawParameter> params = {}, RawTypeRef ret = raw_type("none"))
{
  RawCallable c;
  c.name = std::move(name);
  c.parameters = std::move(params);
  c.return_type = std::move(ret);
  return c;
}

[[nodiscard]] inline RawClass raw_class(
  std::string name, std::string parent = "", std::vector<std::string> implements = {})
{
  RawClass cls;
  cls.name = std::move(name);
  cls.parent = std::move(parent);
  cls.implements = std::move(implements);
  return cls;
}

[[nodiscard]] inline RawProperty raw_property(std::string name, RawTypeRef type)
{
  RawProperty p;
  p.name = std::move(name);
  p.type = std::move(type);
  return p;
}

[[nodiscard]] inline RawField raw_field(std::string name, RawTypeRef type)
{
  RawField f;
  f.name = std::move(name);
  f.type = std::move(type);
  return f;
}

[[nodiscard]] inline RawNamespace raw_namespace(std::string name, std::string version = "1.0")
{
  RawNamespace ns;
  ns.name = std::move(name);
  ns.version = std::move(version);
  return ns;
}

/// Minimal GObject-1.0 with the universal base class
[[nodiscard]] inline RawNamespace raw_gobject()
{
  RawNamespace ns = raw_namespace("GObject", "2.0");
  RawClass object = raw_class("Object");
  object.c_type = "GObject";
  object.methods.push_back(raw_callable(
    "connect", {raw_param("signal", raw_type("utf8"))}, raw_type("gulong")));
  object.methods.push_back(raw_callable("emit", {raw_param("signal", raw_type("utf8"))}));
  ns.classes.push_back(std::move(object));
  return ns;
}

struct TestModel
{
  Model model;
  DiagnosticBag diags;

  [[nodiscard]] Namespace & ns(std::string_view name) { return *model.find(name); }

  [[nodiscard]] BaseClass & cls(std::string_view ns_name, std::string_view class_name)
  {
    return *model.find(ns_name)->find_class(class_name);
  }
};

/// Symbol tables + type resolution, in the given load order
[[nodiscard]] inline std::unique_ptr<TestModel> build_resolved(
  const std::vector<RawNamespace> & trees)
{
  auto out = std::make_unique<TestModel>();
  for (const auto & raw : trees) {
    SymbolTableBuilder builder(&out->diags);
    out->model.add(builder.build(raw));
  }
  const NativeTypeIndex index(out->model);
  const TypeResolver resolver(out->model, index);
  for (const auto & ns : out->model) {
    (void)resolver.resolve_namespace(*ns, out->diags);
  }
  return out;
}

}  // namespace gir_model::test_support
