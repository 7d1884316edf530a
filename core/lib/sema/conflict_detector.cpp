// gir_model/sema/conflict_detector.cpp - Member override conflict classification
#include "gir_model/sema/conflict_detector.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "gir_model/model/type_utils.hpp"

namespace gir_model
{

std::string_view member_kind_name(MemberKind kind) noexcept
{
  switch (kind) {
    case MemberKind::Function:
      return "function";
    case MemberKind::Constructor:
      return "constructor";
    case MemberKind::Property:
      return "property";
    case MemberKind::Field:
      return "field";
  }
  return "function";
}

namespace
{

/// Property names use '-', field and function names use '_'
std::string member_key(const std::string & name)
{
  std::string key = name;
  std::replace(key.begin(), key.end(), '-', '_');
  return key;
}

bool usable(const Function & fn) { return fn.introspectable && !fn.synthesized; }

const TypeExpr * plain(const TypeRef & ref) { return strip_conflict(ref.resolved); }

template <typename Fn>
void for_each_function(const BaseClass & cls, const std::string & key, Fn && fn)
{
  for (const auto & f : cls.constructors) {
    if (usable(f) && member_key(f.name) == key) fn(f);
  }
  for (const auto & f : cls.members) {
    if (usable(f) && member_key(f.name) == key) fn(f);
  }
}

bool has_function(const BaseClass & cls, const std::string & key)
{
  bool found = false;
  for_each_function(cls, key, [&found](const Function &) { found = true; });
  return found;
}

const Property * find_property_by_key(const BaseClass & cls, const std::string & key)
{
  for (const auto & p : cls.properties) {
    if (member_key(p.name) == key) return &p;
  }
  return nullptr;
}

const Field * find_field_by_key(const BaseClass & cls, const std::string & key)
{
  for (const auto & f : cls.fields) {
    if (member_key(f.name) == key) return &f;
  }
  return nullptr;
}

}  // namespace

ConflictDetector::ConflictDetector(const ClassHierarchy & hierarchy, ConflictOptions options)
: hierarchy_(hierarchy), checker_(hierarchy), options_(std::move(options))
{
}

// ============================================================================
// Analysis
// ============================================================================

std::vector<ConflictRecord> ConflictDetector::analyze(const Namespace & ns) const
{
  std::vector<ConflictRecord> records;
  for (const auto & cls : ns.classes) {
    auto class_records = analyze_class(*cls);
    records.insert(records.end(), class_records.begin(), class_records.end());
  }
  return records;
}

std::vector<ConflictRecord> ConflictDetector::analyze_class(const BaseClass & cls) const
{
  std::vector<ConflictRecord> out;
  for (size_t i = 0; i < cls.constructors.size(); ++i) {
    analyze_function(cls, cls.constructors[i], MemberKind::Constructor, i, out);
  }
  for (size_t i = 0; i < cls.members.size(); ++i) {
    analyze_function(cls, cls.members[i], MemberKind::Function, i, out);
  }
  for (size_t i = 0; i < cls.properties.size(); ++i) {
    analyze_property(cls, cls.properties[i], i, out);
  }
  for (size_t i = 0; i < cls.fields.size(); ++i) {
    analyze_field(cls, cls.fields[i], i, out);
  }
  return out;
}

void ConflictDetector::analyze_function(
  const BaseClass & cls, const Function & fn, MemberKind member_kind, size_t index,
  std::vector<ConflictRecord> & out) const
{
  if (!usable(fn)) {
    return;
  }

  const std::string key = member_key(fn.name);
  Finding best;

  // Nearest class (itself first) declaring a same-named field or property
  const BaseClass * data_owner = nullptr;
  if (find_field_by_key(cls, key) != nullptr || find_property_by_key(cls, key) != nullptr) {
    data_owner = &cls;
  }

  for (const BaseClass * ancestor : hierarchy_.ancestors(cls)) {
    for_each_function(*ancestor, key, [&](const Function & parent) {
      const ConflictKind kind = classify_functions(cls, fn, *ancestor, parent);
      if (static_cast<uint8_t>(kind) > static_cast<uint8_t>(best.kind)) {
        best = Finding{kind, ancestor, false};
      }
    });
    if (data_owner == nullptr && (find_field_by_key(*ancestor, key) != nullptr ||
                                  find_property_by_key(*ancestor, key) != nullptr)) {
      data_owner = ancestor;
    }
  }

  std::string ancestor_name = best.ancestor != nullptr ? best.ancestor->qualified_name() : "";
  if (best.kind != ConflictKind::FunctionName && is_reserved(cls, fn.name)) {
    best = Finding{ConflictKind::FunctionName, nullptr, false};
    ancestor_name = options_.universal_base;
  }
  if (best.kind == ConflictKind::None && is_known_conflict(cls, fn.name)) {
    best = Finding{ConflictKind::FunctionName, nullptr, false};
    ancestor_name.clear();
  }
  // A data member only hides the function when nothing else conflicts
  if (best.kind == ConflictKind::None && data_owner != nullptr) {
    best = Finding{ConflictKind::FunctionName, data_owner, true};
    ancestor_name = data_owner->qualified_name();
  }
  if (best.kind == ConflictKind::None) {
    return;
  }

  ConflictResolution resolution = ConflictResolution::Overloaded;
  if (best.kind == ConflictKind::VfuncSignature) {
    resolution = ConflictResolution::EmitOverloads;
  } else if (best.against_data_member) {
    resolution = ConflictResolution::Omitted;
  } else if (best.ancestor != nullptr && inherited_further_up(cls, fn, *best.ancestor)) {
    resolution = ConflictResolution::Omitted;
  }

  out.push_back(
    make_record(cls, fn.name, member_kind, index, best.kind, resolution, ancestor_name));
}

void ConflictDetector::analyze_property(
  const BaseClass & cls, const Property & prop, size_t index,
  std::vector<ConflictRecord> & out) const
{
  const std::string key = member_key(prop.name);
  ConflictKind best = ConflictKind::None;
  const BaseClass * best_ancestor = nullptr;

  auto consider = [&](ConflictKind kind, const BaseClass * ancestor) {
    if (static_cast<uint8_t>(kind) > static_cast<uint8_t>(best)) {
      best = kind;
      best_ancestor = ancestor;
    }
  };

  for (const BaseClass * ancestor : hierarchy_.ancestors(cls)) {
    if (const Property * parent = find_property_by_key(*ancestor, key)) {
      if (!checker_.is_subtype_of(&cls, ancestor, plain(prop.type), plain(parent->type))) {
        consider(ConflictKind::PropertyName, ancestor);
      }
    }
    if (find_field_by_key(*ancestor, key) != nullptr) {
      consider(ConflictKind::AccessorProperty, ancestor);
    }
    if (has_function(*ancestor, key)) {
      consider(ConflictKind::FunctionName, ancestor);
    }
  }

  std::string ancestor_name = best_ancestor != nullptr ? best_ancestor->qualified_name() : "";
  if (best != ConflictKind::FunctionName && is_reserved(cls, prop.name)) {
    best = ConflictKind::FunctionName;
    ancestor_name = options_.universal_base;
  }
  if (best == ConflictKind::None && is_known_conflict(cls, prop.name)) {
    best = ConflictKind::PropertyName;
  }
  if (best == ConflictKind::None) {
    return;
  }

  out.push_back(make_record(
    cls, prop.name, MemberKind::Property, index, best, ConflictResolution::Wrapped, ancestor_name));
}

void ConflictDetector::analyze_field(
  const BaseClass & cls, const Field & field, size_t index,
  std::vector<ConflictRecord> & out) const
{
  const std::string key = member_key(field.name);
  ConflictKind best = ConflictKind::None;
  const BaseClass * best_ancestor = nullptr;

  auto consider = [&](ConflictKind kind, const BaseClass * ancestor) {
    if (static_cast<uint8_t>(kind) > static_cast<uint8_t>(best)) {
      best = kind;
      best_ancestor = ancestor;
    }
  };

  for (const BaseClass * ancestor : hierarchy_.ancestors(cls)) {
    if (const Field * parent = find_field_by_key(*ancestor, key)) {
      if (!checker_.is_subtype_of(&cls, ancestor, plain(field.type), plain(parent->type))) {
        consider(ConflictKind::FieldName, ancestor);
      }
    }
    if (find_property_by_key(*ancestor, key) != nullptr) {
      consider(ConflictKind::AccessorProperty, ancestor);
    }
    if (has_function(*ancestor, key)) {
      consider(ConflictKind::FunctionName, ancestor);
    }
  }

  std::string ancestor_name = best_ancestor != nullptr ? best_ancestor->qualified_name() : "";
  if (best != ConflictKind::FunctionName && is_reserved(cls, field.name)) {
    best = ConflictKind::FunctionName;
    ancestor_name = options_.universal_base;
  }
  if (best == ConflictKind::None && is_known_conflict(cls, field.name)) {
    best = ConflictKind::FieldName;
  }
  if (best == ConflictKind::None) {
    return;
  }

  out.push_back(make_record(
    cls, field.name, MemberKind::Field, index, best, ConflictResolution::Wrapped, ancestor_name));
}

ConflictKind ConflictDetector::classify_functions(
  const BaseClass & cls, const Function & child, const BaseClass & ancestor,
  const Function & parent) const
{
  const bool child_ctor = child.kind == FunctionKind::Constructor;
  const bool parent_ctor = parent.kind == FunctionKind::Constructor;
  if (child_ctor != parent_ctor) {
    return ConflictKind::FunctionName;
  }
  // Static, instance and virtual functions live in different slots
  if (child.kind != parent.kind) {
    return ConflictKind::None;
  }
  if (signature_incompatible(cls, child, ancestor, parent)) {
    return ConflictKind::FunctionName;
  }
  if (child.kind == FunctionKind::Virtual && cls.is_interface() &&
      signature_differs(child, parent)) {
    return ConflictKind::VfuncSignature;
  }
  return ConflictKind::None;
}

bool ConflictDetector::signature_incompatible(
  const BaseClass & cls, const Function & child, const BaseClass & ancestor,
  const Function & parent) const
{
  if (child.parameters.size() > parent.parameters.size()) {
    return true;
  }
  if (!checker_.is_subtype_of(
        &cls, &ancestor, plain(child.return_type), plain(parent.return_type))) {
    return true;
  }
  for (size_t i = 0; i < child.parameters.size(); ++i) {
    if (!checker_.is_subtype_of(
          &cls, &ancestor, plain(child.parameters[i].type), plain(parent.parameters[i].type))) {
      return true;
    }
  }
  if (child.output_parameters.size() != parent.output_parameters.size()) {
    return true;
  }
  for (size_t i = 0; i < child.output_parameters.size(); ++i) {
    if (!checker_.is_subtype_of(
          &cls, &ancestor, plain(child.output_parameters[i].type),
          plain(parent.output_parameters[i].type))) {
      return true;
    }
  }
  return false;
}

bool ConflictDetector::signature_differs(const Function & a, const Function & b)
{
  if (a.parameters.size() != b.parameters.size() ||
      a.output_parameters.size() != b.output_parameters.size()) {
    return true;
  }
  if (!type_equals(plain(a.return_type), plain(b.return_type))) {
    return true;
  }
  for (size_t i = 0; i < a.parameters.size(); ++i) {
    if (!type_equals(plain(a.parameters[i].type), plain(b.parameters[i].type))) return true;
  }
  for (size_t i = 0; i < a.output_parameters.size(); ++i) {
    if (!type_equals(plain(a.output_parameters[i].type), plain(b.output_parameters[i].type))) {
      return true;
    }
  }
  return false;
}

bool ConflictDetector::inherited_further_up(
  const BaseClass & cls, const Function & fn, const BaseClass & root) const
{
  const std::string key = member_key(fn.name);
  for (const BaseClass * between : hierarchy_.ancestors(cls)) {
    if (between == &root || !hierarchy_.derives_from(*between, root)) {
      continue;
    }
    bool found = false;
    for_each_function(*between, key, [&](const Function & mid) {
      if (found || mid.kind != fn.kind || signature_differs(fn, mid)) {
        return;
      }
      for_each_function(root, key, [&](const Function & top) {
        if (classify_functions(*between, mid, root, top) == ConflictKind::FunctionName) {
          found = true;
        }
      });
    });
    if (found) {
      return true;
    }
  }
  return false;
}

bool ConflictDetector::is_known_conflict(const BaseClass & cls, const std::string & name) const
{
  auto it = options_.known_conflicts.find(cls.namespace_name);
  if (it == options_.known_conflicts.end()) {
    return false;
  }
  return it->second.count(name) > 0 || it->second.count(cls.name + "." + name) > 0;
}

bool ConflictDetector::is_reserved(const BaseClass & cls, const std::string & name) const
{
  if (options_.reserved_members.count(name) == 0 || options_.universal_base.empty()) {
    return false;
  }
  return cls.qualified_name() != options_.universal_base &&
         hierarchy_.rooted_at(cls, options_.universal_base);
}

ConflictRecord ConflictDetector::make_record(
  const BaseClass & cls, const std::string & member, MemberKind member_kind, size_t index,
  ConflictKind kind, ConflictResolution resolution, const std::string & ancestor)
{
  ConflictRecord rec;
  rec.ns = cls.namespace_name;
  rec.class_name = cls.name;
  rec.member = member;
  rec.member_kind = member_kind;
  rec.kind = kind;
  rec.resolution = resolution;
  rec.ancestor = ancestor;
  rec.member_index = index;
  return rec;
}

// ============================================================================
// Application
// ============================================================================

namespace
{

Function make_never_overload(TypeContext & ctx, const Function & original, const std::string & note)
{
  Function overload;
  overload.name = original.name;
  overload.kind = original.kind;
  overload.synthesized = true;
  overload.note = note;

  Parameter args;
  args.name = "args";
  args.varargs = true;
  args.type.resolved = ctx.array(TypeContext::never());
  overload.parameters.push_back(std::move(args));
  overload.return_type.resolved = TypeContext::any();
  return overload;
}

bool has_synthesized(const std::vector<Function> & functions, const std::string & name)
{
  return std::any_of(functions.begin(), functions.end(), [&name](const Function & f) {
    return f.synthesized && f.name == name;
  });
}

template <typename Member>
bool matches(const std::vector<Member> & items, size_t index, const std::string & name)
{
  return index < items.size() && items[index].name == name;
}

}  // namespace

void ConflictDetector::apply(Namespace & ns, const std::vector<ConflictRecord> & records)
{
  TypeContext & ctx = ns.types();

  for (const auto & rec : records) {
    BaseClass * cls = ns.find_class(rec.class_name);
    if (cls == nullptr || rec.ns != ns.name()) {
      continue;
    }
    const ConflictAnnotation annotation{rec.kind, rec.resolution, rec.ancestor};

    switch (rec.member_kind) {
      case MemberKind::Property: {
        if (!matches(cls->properties, rec.member_index, rec.member)) break;
        Property & prop = cls->properties[rec.member_index];
        prop.conflict = annotation;
        if (rec.resolution == ConflictResolution::Wrapped) {
          const TypeExpr * inner = prop.type.resolved ? prop.type.resolved : TypeContext::any();
          prop.type.resolved = ctx.conflict_marker(inner, rec.kind);
        }
        break;
      }
      case MemberKind::Field: {
        if (!matches(cls->fields, rec.member_index, rec.member)) break;
        Field & field = cls->fields[rec.member_index];
        field.conflict = annotation;
        if (rec.resolution == ConflictResolution::Wrapped) {
          const TypeExpr * inner = field.type.resolved ? field.type.resolved : TypeContext::any();
          field.type.resolved = ctx.conflict_marker(inner, rec.kind);
        }
        break;
      }
      case MemberKind::Function:
      case MemberKind::Constructor: {
        auto & functions =
          rec.member_kind == MemberKind::Constructor ? cls->constructors : cls->members;
        if (!matches(functions, rec.member_index, rec.member)) break;

        Function & fn = functions[rec.member_index];
        fn.conflict = annotation;
        switch (rec.resolution) {
          case ConflictResolution::Omitted:
            fn.omitted = true;
            break;
          case ConflictResolution::EmitOverloads:
            fn.emit_overloads = true;
            cls->has_vfunc_signature_conflicts = true;
            break;
          case ConflictResolution::Overloaded:
            if (!has_synthesized(functions, fn.name)) {
              const std::string note =
                rec.ancestor.empty()
                  ? fmt::format("conflicted with a known problematic member '{}'", fn.name)
                  : fmt::format("conflicted with {}.{}", rec.ancestor, fn.name);
              // Build before push_back; `fn` is invalidated by the insertion
              Function overload = make_never_overload(ctx, fn, note);
              functions.push_back(std::move(overload));
            }
            break;
          case ConflictResolution::Wrapped:
          case ConflictResolution::None:
            break;
        }
        break;
      }
    }
  }
}

// ============================================================================
// Reporting
// ============================================================================

void ConflictDetector::report(
  const Namespace & ns, const std::vector<ConflictRecord> & records, DiagnosticBag & diags)
{
  for (const auto & rec : records) {
    std::string_view code = "C005";
    switch (rec.kind) {
      case ConflictKind::FieldName:
        code = "C001";
        break;
      case ConflictKind::PropertyName:
        code = "C002";
        break;
      case ConflictKind::AccessorProperty:
        code = "C003";
        break;
      case ConflictKind::VfuncSignature:
        code = "C004";
        break;
      case ConflictKind::FunctionName:
        if (rec.resolution == ConflictResolution::Omitted) {
          code = "C006";
        } else if (rec.resolution == ConflictResolution::Wrapped) {
          code = "C007";
        }
        break;
      case ConflictKind::None:
        break;
    }

    const SymbolLocation location{
      ns.package_name(), fmt::format("{}.{}.{}", rec.ns, rec.class_name, rec.member)};
    const std::string against =
      rec.ancestor.empty() ? std::string("a known conflict list") : rec.ancestor;
    const std::string message = fmt::format(
      "{} '{}' conflicts with {} ({})", member_kind_name(rec.member_kind), rec.member, against,
      conflict_kind_name(rec.kind));
    const std::string label = fmt::format("{}", conflict_resolution_name(rec.resolution));

    const bool informational = rec.resolution == ConflictResolution::Omitted ||
                               rec.resolution == ConflictResolution::EmitOverloads;
    auto builder = informational ? diags.report_info(location, message, label)
                                 : diags.report_warning(location, message, label);
    builder.with_code(std::string(code));
    if (!rec.ancestor.empty()) {
      builder.with_secondary_label(
        SymbolLocation{"", fmt::format("{}.{}", rec.ancestor, rec.member)}, "declared here");
    }
  }
}

}  // namespace gir_model
