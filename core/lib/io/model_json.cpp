// gir_model/io/model_json.cpp - JSON export implementation
//
#include "gir_model/io/model_json.hpp"

#include <string>
#include <string_view>

#include "gir_model/model/type_utils.hpp"

namespace gir_model
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

std::string_view direction_name(Direction d)
{
  switch (d) {
    case Direction::In:
      return "in";
    case Direction::Out:
      return "out";
    case Direction::InOut:
      return "inout";
  }
  return "in";
}

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

json j_location(const SymbolLocation & loc)
{
  return json{{"package", loc.package}, {"symbol", loc.symbol}};
}

json j_conflict(const ConflictAnnotation & c)
{
  return json{
    {"kind", std::string(conflict_kind_name(c.kind))},
    {"resolution", std::string(conflict_resolution_name(c.resolution))},
    {"ancestor", c.ancestor}};
}

json j_parameter(const Parameter & p)
{
  json j{
    {"name", p.name},
    {"type", type_to_json(p.type.resolved)},
    {"direction", std::string(direction_name(p.direction))}};
  if (p.varargs) {
    j["varargs"] = true;
  }
  return j;
}

json j_parameters(const std::vector<Parameter> & params)
{
  json arr = json::array();
  for (const auto & p : params) {
    arr.push_back(j_parameter(p));
  }
  return arr;
}

json j_function(const Function & fn)
{
  json j{
    {"name", fn.name},
    {"kind", std::string(function_kind_name(fn.kind))},
    {"parameters", j_parameters(fn.parameters)},
    {"output_parameters", j_parameters(fn.output_parameters)},
    {"return_type", type_to_json(fn.return_type.resolved)},
    {"introspectable", fn.introspectable}};
  if (fn.synthesized) j["synthesized"] = true;
  if (fn.emit_overloads) j["emit_overloads"] = true;
  if (fn.omitted) j["omitted"] = true;
  if (!fn.note.empty()) j["note"] = fn.note;
  if (fn.conflict.is_conflicted()) j["conflict"] = j_conflict(fn.conflict);
  return j;
}

json j_functions(const std::vector<Function> & fns)
{
  json arr = json::array();
  for (const auto & fn : fns) {
    arr.push_back(j_function(fn));
  }
  return arr;
}

json j_callback(const Callback & cb)
{
  return json{
    {"name", cb.name},
    {"parameters", j_parameters(cb.parameters)},
    {"return_type", type_to_json(cb.return_type.resolved)}};
}

json j_callbacks(const std::vector<Callback> & cbs)
{
  json arr = json::array();
  for (const auto & cb : cbs) {
    arr.push_back(j_callback(cb));
  }
  return arr;
}

json j_class(const BaseClass & cls)
{
  json j{
    {"kind", std::string(class_kind_name(cls.kind))},
    {"name", cls.name},
    {"c_type", cls.c_type}};

  if (cls.super_type) {
    j["super_type"] = type_to_json(cls.super_type->resolved);
  }

  json interfaces = json::array();
  for (const auto & iface : cls.interfaces) {
    interfaces.push_back(type_to_json(iface.resolved));
  }
  j["interfaces"] = std::move(interfaces);

  json generics = json::array();
  for (const auto & g : cls.generics) {
    generics.push_back(json{
      {"name", g.name},
      {"constraint", type_to_json(g.constraint)},
      {"default", type_to_json(g.default_type)}});
  }
  j["generics"] = std::move(generics);

  j["constructors"] = j_functions(cls.constructors);
  j["members"] = j_functions(cls.members);

  json properties = json::array();
  for (const auto & p : cls.properties) {
    json jp{
      {"name", p.name},
      {"type", type_to_json(p.type.resolved)},
      {"readable", p.readable},
      {"writable", p.writable},
      {"construct_only", p.construct_only}};
    if (p.conflict.is_conflicted()) jp["conflict"] = j_conflict(p.conflict);
    properties.push_back(std::move(jp));
  }
  j["properties"] = std::move(properties);

  json fields = json::array();
  for (const auto & f : cls.fields) {
    json jf{{"name", f.name}, {"type", type_to_json(f.type.resolved)}, {"writable", f.writable}};
    if (f.conflict.is_conflicted()) jf["conflict"] = j_conflict(f.conflict);
    fields.push_back(std::move(jf));
  }
  j["fields"] = std::move(fields);

  j["callbacks"] = j_callbacks(cls.callbacks);
  if (cls.has_vfunc_signature_conflicts) {
    j["has_vfunc_signature_conflicts"] = true;
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json type_to_json(const TypeExpr * type)
{
  if (type == nullptr) {
    return nullptr;
  }
  return to_string(type);
}

json namespace_to_json(const Namespace & ns)
{
  json j{
    {"name", ns.name()},
    {"version", ns.version()},
    {"package", ns.package_name()},
    {"c_prefix", ns.c_prefix}};

  json includes = json::array();
  for (const auto & inc : ns.includes) {
    includes.push_back(inc.package_name());
  }
  j["includes"] = std::move(includes);

  json classes = json::array();
  for (const auto & cls : ns.classes) {
    classes.push_back(j_class(*cls));
  }
  j["classes"] = std::move(classes);

  json enums = json::array();
  for (const auto & en : ns.enums) {
    json members = json::array();
    for (const auto & m : en.members) {
      members.push_back(json{{"name", m.name}, {"value", m.value}});
    }
    enums.push_back(json{
      {"name", en.name},
      {"c_type", en.c_type},
      {"bitfield", en.is_bitfield},
      {"members", std::move(members)}});
  }
  j["enums"] = std::move(enums);

  j["functions"] = j_functions(ns.functions);
  j["callbacks"] = j_callbacks(ns.callbacks);

  json constants = json::array();
  for (const auto & c : ns.constants) {
    constants.push_back(
      json{{"name", c.name}, {"type", type_to_json(c.type.resolved)}, {"value", c.value}});
  }
  j["constants"] = std::move(constants);

  json aliases = json::array();
  for (const auto & a : ns.aliases) {
    aliases.push_back(json{
      {"name", a.name}, {"c_type", a.c_type}, {"target", type_to_json(a.target.resolved)}});
  }
  j["aliases"] = std::move(aliases);
  return j;
}

json groups_to_json(const std::vector<ModuleGroup> & groups)
{
  json arr = json::array();
  for (const auto & g : groups) {
    json modules = json::array();
    for (const auto & m : g.modules) {
      modules.push_back(json{
        {"namespace", m.ns}, {"version", m.version}, {"path", m.path.generic_string()}});
    }
    json jg{
      {"namespace", g.ns},
      {"state", std::string(group_state_name(g.state))},
      {"has_conflict", g.has_conflict},
      {"modules", std::move(modules)}};
    if (const ModuleFile * selected = g.selected_module()) {
      jg["selected"] = selected->package_name();
    }
    if (g.auto_loaded) {
      jg["auto_loaded"] = true;
    }
    arr.push_back(std::move(jg));
  }
  return arr;
}

json model_to_json(const Model & model, const std::vector<ModuleGroup> & groups)
{
  json namespaces = json::array();
  for (const auto & ns : model) {
    namespaces.push_back(namespace_to_json(*ns));
  }

  std::vector<ModuleGroup> rejected;
  for (const auto & g : groups) {
    if (g.state == GroupState::Conflicting || g.state == GroupState::Failed) {
      rejected.push_back(g);
    }
  }

  return json{{"namespaces", std::move(namespaces)}, {"rejected", groups_to_json(rejected)}};
}

json diagnostic_to_json(const Diagnostic & diag)
{
  json j{
    {"severity", std::string(severity_name(diag.severity))},
    {"code", diag.code},
    {"message", diag.message},
    {"location", j_location(diag.primary_location())}};

  json notes = json::array();
  for (const auto & label : diag.labels) {
    if (label.style == LabelStyle::Secondary) {
      notes.push_back(json{{"location", j_location(label.location)}, {"message", label.message}});
    }
  }
  if (!notes.empty()) {
    j["notes"] = std::move(notes);
  }
  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

json report_to_json(const std::vector<ConflictRecord> & records, const DiagnosticBag & diags)
{
  json conflicts = json::array();
  for (const auto & r : records) {
    conflicts.push_back(json{
      {"namespace", r.ns},
      {"class", r.class_name},
      {"member", r.member},
      {"member_kind", std::string(member_kind_name(r.member_kind))},
      {"kind", std::string(conflict_kind_name(r.kind))},
      {"resolution", std::string(conflict_resolution_name(r.resolution))},
      {"ancestor", r.ancestor}});
  }

  json diagnostics = json::array();
  size_t errors = 0;
  size_t warnings = 0;
  for (const auto & d : diags) {
    diagnostics.push_back(diagnostic_to_json(d));
    if (d.severity == Severity::Error) ++errors;
    if (d.severity == Severity::Warning) ++warnings;
  }

  return json{
    {"summary",
     json{{"conflicts", records.size()}, {"errors", errors}, {"warnings", warnings}}},
    {"conflicts", std::move(conflicts)},
    {"diagnostics", std::move(diagnostics)}};
}

}  // namespace gir_model
