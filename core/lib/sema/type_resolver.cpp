// gir_model/sema/type_resolver.cpp - Ordered reference resolution
#include "gir_model/sema/type_resolver.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "gir_model/model/type_utils.hpp"

namespace gir_model
{

std::string_view resolution_step_name(ResolutionStep step) noexcept
{
  switch (step) {
    case ResolutionStep::Fundamental:
      return "fundamental";
    case ResolutionStep::Exact:
      return "exact";
    case ResolutionStep::Scoped:
      return "scoped";
    case ResolutionStep::NativeName:
      return "native-name";
    case ResolutionStep::Global:
      return "global";
    case ResolutionStep::Unresolved:
      return "unresolved";
  }
  return "unresolved";
}

namespace
{

constexpr std::string_view k_any_marker = "<any>";

/// GIR fundamental type names -> runtime primitive names (k_any_marker -> Any)
const std::unordered_map<std::string_view, std::string_view> & fundamental_table()
{
  static const std::unordered_map<std::string_view, std::string_view> table = {
    {"none", "void"},          {"void", "void"},         {"gboolean", "boolean"},
    {"gchar", "number"},       {"guchar", "number"},     {"gshort", "number"},
    {"gushort", "number"},     {"gint", "number"},       {"guint", "number"},
    {"glong", "number"},       {"gulong", "number"},     {"gint8", "number"},
    {"guint8", "number"},      {"gint16", "number"},     {"guint16", "number"},
    {"gint32", "number"},      {"guint32", "number"},    {"gint64", "number"},
    {"guint64", "number"},     {"gfloat", "number"},     {"gdouble", "number"},
    {"gsize", "number"},       {"gssize", "number"},     {"goffset", "number"},
    {"gintptr", "number"},     {"guintptr", "number"},   {"gunichar", "number"},
    {"long double", "number"}, {"int", "number"},        {"double", "number"},
    {"utf8", "string"},        {"filename", "string"},   {"gpointer", k_any_marker},
    {"gconstpointer", k_any_marker}, {"va_list", k_any_marker},
  };
  return table;
}

std::string_view last_segment(std::string_view name)
{
  const auto pos = name.rfind('.');
  return pos == std::string_view::npos ? name : name.substr(pos + 1);
}

}  // namespace

// ============================================================================
// NativeTypeIndex
// ============================================================================

NativeTypeIndex::NativeTypeIndex(const Model & model)
{
  for (const auto & ns : model) {
    auto add = [&](std::string_view c_type, const std::string & name) {
      if (c_type.empty()) {
        return;
      }
      entries_.emplace(normalize(c_type), Entry{ns->name(), name});
    };
    for (const auto & cls : ns->classes) {
      add(cls->c_type, cls->name);
    }
    for (const auto & en : ns->enums) {
      add(en.c_type, en.name);
    }
    for (const auto & alias : ns->aliases) {
      add(alias.c_type, alias.name);
    }
  }
}

const NativeTypeIndex::Entry * NativeTypeIndex::find(std::string_view c_type) const
{
  if (c_type.empty()) {
    return nullptr;
  }
  auto it = entries_.find(normalize(c_type));
  return it == entries_.end() ? nullptr : &it->second;
}

std::string NativeTypeIndex::normalize(std::string_view c_type)
{
  std::string out;
  size_t pos = 0;
  while (pos < c_type.size()) {
    const size_t end = std::min(c_type.find(' ', pos), c_type.size());
    std::string_view token = c_type.substr(pos, end - pos);
    pos = end + 1;
    while (!token.empty() && token.back() == '*') {
      token.remove_suffix(1);
    }
    while (!token.empty() && token.front() == '*') {
      token.remove_prefix(1);
    }
    if (token.empty() || token == "const" || token == "volatile") {
      continue;
    }
    out.append(token);
  }
  return out;
}

// ============================================================================
// TypeResolver
// ============================================================================

TypeResolver::TypeResolver(const Model & model, const NativeTypeIndex & index)
: model_(model), index_(index)
{
}

Resolution TypeResolver::resolve(const RawTypeRef & ref, Namespace & ns) const
{
  TypeContext & ctx = ns.types();
  uint32_t depth = ref.array_depth;
  Resolution res;

  // Byte arrays map to a dedicated primitive
  if (depth > 0 && ref.name == "guint8") {
    res = Resolution{ctx.primitive("Uint8Array"), ResolutionStep::Fundamental, {}};
    --depth;
  } else {
    res = resolve_name(ref.name, ref.c_type, ns);
  }

  if (!ref.type_arguments.empty() && !res.is_fallback()) {
    std::vector<const TypeExpr *> args;
    args.reserve(ref.type_arguments.size());
    for (const auto & arg : ref.type_arguments) {
      args.push_back(resolve(arg, ns).type);
    }
    res.type = ctx.generified(res.type, args);
  }
  if (depth > 0) {
    res.type = ctx.array(res.type, depth);
  }
  if (ref.nullable) {
    res.type = ctx.nullable(res.type);
  }
  return res;
}

Resolution TypeResolver::resolve_name(
  std::string_view name, std::string_view c_type, Namespace & ns) const
{
  if (auto r = try_fundamental(name, ns)) {
    return std::move(*r);
  }
  if (auto r = try_exact(name, ns)) {
    return std::move(*r);
  }
  if (auto r = try_scoped(name, ns)) {
    return std::move(*r);
  }
  if (auto r = try_native(name, c_type, ns)) {
    return std::move(*r);
  }
  if (auto r = try_global(name, ns)) {
    return std::move(*r);
  }
  return Resolution{
    TypeContext::any(), ResolutionStep::Unresolved,
    fmt::format(
      "unresolved type reference '{}'{}", name,
      c_type.empty() ? std::string() : fmt::format(" (c_type '{}')", c_type))};
}

std::optional<Resolution> TypeResolver::try_fundamental(std::string_view name, Namespace & ns) const
{
  TypeContext & ctx = ns.types();
  if (name.empty()) {
    return Resolution{ctx.primitive("void"), ResolutionStep::Fundamental, {}};
  }
  if (name == "GType") {
    return Resolution{ctx.identifier("GObject", "GType"), ResolutionStep::Fundamental, {}};
  }
  const auto & table = fundamental_table();
  auto it = table.find(name);
  if (it == table.end()) {
    return std::nullopt;
  }
  if (it->second == k_any_marker) {
    return Resolution{TypeContext::any(), ResolutionStep::Fundamental, {}};
  }
  return Resolution{ctx.primitive(it->second), ResolutionStep::Fundamental, {}};
}

std::optional<Resolution> TypeResolver::try_exact(std::string_view name, Namespace & ns) const
{
  const auto dot = name.find('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view prefix = name.substr(0, dot);
  const std::string_view suffix = name.substr(dot + 1);
  TypeContext & ctx = ns.types();

  // Ns.Name or Ns.Container.Name
  const Namespace * target = prefix == ns.name() ? &ns : model_.find(prefix);
  if (target != nullptr) {
    const auto inner_dot = suffix.find('.');
    if (inner_dot == std::string_view::npos) {
      if (target->contains(suffix)) {
        return Resolution{ctx.identifier(target->name(), suffix), ResolutionStep::Exact, {}};
      }
    } else {
      const std::string_view container = suffix.substr(0, inner_dot);
      const std::string_view nested = suffix.substr(inner_dot + 1);
      const BaseClass * owner = target->find_class(container);
      if (owner != nullptr && owner->owns_nested(nested)) {
        return Resolution{
          ctx.scoped(target->name(), container, nested), ResolutionStep::Exact, {}};
      }
    }
  }

  // Container.Name relative to the current namespace
  if (suffix.find('.') == std::string_view::npos) {
    const BaseClass * owner = ns.find_class(prefix);
    if (owner != nullptr && owner->owns_nested(suffix)) {
      return Resolution{ctx.scoped(ns.name(), prefix, suffix), ResolutionStep::Exact, {}};
    }
  }
  return std::nullopt;
}

std::optional<Resolution> TypeResolver::try_scoped(std::string_view name, Namespace & ns) const
{
  if (name.find('.') != std::string_view::npos || name.size() < 2) {
    return std::nullopt;
  }

  // Longest container prefix wins
  for (size_t len = name.size() - 1; len > 0; --len) {
    const std::string_view container = name.substr(0, len);
    const std::string_view nested = name.substr(len);
    const BaseClass * owner = ns.find_class(container);
    if (owner == nullptr || !owner->owns_nested(nested)) {
      continue;
    }

    Resolution res{ns.types().scoped(ns.name(), container, nested), ResolutionStep::Scoped, {}};
    if (ns.contains(name)) {
      res.note = fmt::format(
        "'{}' resolved to nested '{}.{}' over the global declaration '{}.{}'", name, container,
        nested, ns.name(), name);
    }
    return res;
  }
  return std::nullopt;
}

std::optional<Resolution> TypeResolver::try_native(
  std::string_view name, std::string_view c_type, Namespace & ns) const
{
  const NativeTypeIndex::Entry * entry = index_.find(c_type);
  if (entry == nullptr) {
    return std::nullopt;
  }

  Resolution res{ns.types().identifier(entry->ns, entry->name), ResolutionStep::NativeName, {}};
  const bool same_decl = entry->ns == ns.name() && entry->name == last_segment(name);
  if (!same_decl) {
    res.note = fmt::format(
      "'{}' resolved through native type name '{}' to '{}.{}'", name, c_type, entry->ns,
      entry->name);
  }
  return res;
}

std::optional<Resolution> TypeResolver::try_global(std::string_view name, Namespace & ns) const
{
  if (name.find('.') != std::string_view::npos) {
    return std::nullopt;
  }
  if (ns.contains(name)) {
    return Resolution{ns.types().identifier(ns.name(), name), ResolutionStep::Global, {}};
  }
  for (const auto & other : model_) {
    if (other.get() == &ns || !other->contains(name)) {
      continue;
    }
    return Resolution{
      ns.types().identifier(other->name(), name), ResolutionStep::Global,
      fmt::format("'{}' resolved to '{}.{}' from another namespace", name, other->name(), name)};
  }
  return std::nullopt;
}

// ============================================================================
// Namespace walk
// ============================================================================

namespace
{

class SlotWalker
{
public:
  SlotWalker(const TypeResolver & resolver, Namespace & ns, DiagnosticBag & diags)
  : resolver_(resolver), ns_(ns), diags_(diags)
  {
  }

  size_t run()
  {
    for (auto & cls : ns_.classes) {
      walk_class(*cls);
    }
    for (auto & fn : ns_.functions) {
      walk_function(fn, ns_.name());
    }
    for (auto & cb : ns_.callbacks) {
      walk_callback(cb, ns_.name());
    }
    for (auto & c : ns_.constants) {
      slot(c.type, ns_.name() + "." + c.name);
    }
    for (auto & a : ns_.aliases) {
      slot(a.target, ns_.name() + "." + a.name);
    }
    return fallbacks_;
  }

private:
  void walk_class(BaseClass & cls)
  {
    const std::string path = cls.qualified_name();
    if (cls.super_type) {
      slot(*cls.super_type, path);
    }
    for (auto & iface : cls.interfaces) {
      slot(iface, path);
    }
    for (auto & ctor : cls.constructors) {
      walk_function(ctor, path);
    }
    for (auto & fn : cls.members) {
      walk_function(fn, path);
    }
    for (auto & prop : cls.properties) {
      slot(prop.type, path + "." + prop.name);
    }
    for (auto & field : cls.fields) {
      slot(field.type, path + "." + field.name);
    }
    for (auto & cb : cls.callbacks) {
      walk_callback(cb, path);
    }
  }

  void walk_function(Function & fn, const std::string & owner)
  {
    const std::string path = owner + "." + fn.name;
    for (auto & p : fn.parameters) {
      slot(p.type, path);
    }
    for (auto & p : fn.output_parameters) {
      slot(p.type, path);
    }
    slot(fn.return_type, path);
  }

  void walk_callback(Callback & cb, const std::string & owner)
  {
    const std::string path = owner + "." + cb.name;
    for (auto & p : cb.parameters) {
      slot(p.type, path);
    }
    slot(cb.return_type, path);
  }

  void slot(TypeRef & ref, const std::string & symbol)
  {
    if (ref.is_resolved()) {
      return;
    }
    Resolution res = resolver_.resolve(ref.raw, ns_);
    ref.resolved = res.type;
    report(res, symbol);
  }

  void report(const Resolution & res, const std::string & symbol)
  {
    if (res.is_fallback()) {
      ++fallbacks_;
      diags_.report_warning(SymbolLocation{ns_.package_name(), symbol}, res.note, "typed as any")
        .with_code("R001");
      return;
    }
    if (res.note.empty()) {
      return;
    }
    switch (res.step) {
      case ResolutionStep::Scoped:
        diags_.report_warning(SymbolLocation{ns_.package_name(), symbol}, res.note)
          .with_code("R002")
          .with_help("qualify the reference to select the global declaration");
        break;
      case ResolutionStep::NativeName:
        diags_.report_hint(SymbolLocation{ns_.package_name(), symbol}, res.note)
          .with_code("R003");
        break;
      case ResolutionStep::Global:
        diags_.report_hint(SymbolLocation{ns_.package_name(), symbol}, res.note)
          .with_code("R004");
        break;
      case ResolutionStep::Fundamental:
      case ResolutionStep::Exact:
      case ResolutionStep::Unresolved:
        break;
    }
  }

  const TypeResolver & resolver_;
  Namespace & ns_;
  DiagnosticBag & diags_;
  size_t fallbacks_ = 0;
};

}  // namespace

size_t TypeResolver::resolve_namespace(Namespace & ns, DiagnosticBag & diags) const
{
  SlotWalker walker(*this, ns, diags);
  return walker.run();
}

}  // namespace gir_model
