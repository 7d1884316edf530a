// gir_model/io/raw_tree_reader.cpp - JSON raw tree reading
//
#include "gir_model/io/raw_tree_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gir_model
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

std::string j_string(const json & j, const char * key)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  return it->get<std::string>();
}

bool j_bool(const json & j, const char * key, bool fallback)
{
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  return it->get<bool>();
}

const json & j_array(const json & j, const char * key)
{
  static const json k_empty = json::array();
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) return k_empty;
  return *it;
}

RawTypeRef r_type(const json & j)
{
  RawTypeRef ref;
  if (j.is_null()) {
    return ref;
  }
  // Shorthand: "utf8"
  if (j.is_string()) {
    ref.name = j.get<std::string>();
    return ref;
  }
  ref.name = j_string(j, "name");
  ref.c_type = j_string(j, "c_type");
  if (auto it = j.find("array"); it != j.end() && !it->is_null()) {
    ref.array_depth = it->is_boolean() ? (it->get<bool>() ? 1U : 0U) : it->get<uint32_t>();
  }
  ref.nullable = j_bool(j, "nullable", false);
  for (const auto & arg : j_array(j, "type_arguments")) {
    ref.type_arguments.push_back(r_type(arg));
  }
  return ref;
}

RawTypeRef r_type_at(const json & j, const char * key)
{
  auto it = j.find(key);
  return it == j.end() ? RawTypeRef{} : r_type(*it);
}

Direction r_direction(const std::string & text)
{
  if (text == "out") return Direction::Out;
  if (text == "inout") return Direction::InOut;
  if (text.empty() || text == "in") return Direction::In;
  throw std::invalid_argument("unknown parameter direction '" + text + "'");
}

RawCallable r_callable(const json & j)
{
  RawCallable c;
  c.name = j.at("name").get<std::string>();
  c.introspectable = j_bool(j, "introspectable", true);
  c.return_type = r_type_at(j, "return_type");
  for (const auto & p : j_array(j, "parameters")) {
    RawParameter param;
    param.name = j_string(p, "name");
    param.type = r_type_at(p, "type");
    param.direction = r_direction(j_string(p, "direction"));
    param.varargs = j_bool(p, "varargs", false);
    c.parameters.push_back(std::move(param));
  }
  return c;
}

std::vector<RawCallable> r_callables(const json & j, const char * key)
{
  std::vector<RawCallable> out;
  for (const auto & item : j_array(j, key)) {
    out.push_back(r_callable(item));
  }
  return out;
}

std::vector<std::string> r_names(const json & j, const char * key)
{
  std::vector<std::string> out;
  for (const auto & item : j_array(j, key)) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

RawClass r_class(const json & j)
{
  RawClass cls;
  cls.name = j.at("name").get<std::string>();
  cls.c_type = j_string(j, "c_type");
  cls.parent = j_string(j, "parent");
  cls.implements = r_names(j, "implements");
  for (auto & prereq : r_names(j, "prerequisites")) {
    cls.implements.push_back(std::move(prereq));
  }
  cls.constructors = r_callables(j, "constructors");
  cls.methods = r_callables(j, "methods");
  cls.virtual_methods = r_callables(j, "virtual_methods");
  cls.functions = r_callables(j, "functions");
  cls.callbacks = r_callables(j, "callbacks");

  for (const auto & p : j_array(j, "properties")) {
    RawProperty prop;
    prop.name = p.at("name").get<std::string>();
    prop.type = r_type_at(p, "type");
    prop.readable = j_bool(p, "readable", true);
    prop.writable = j_bool(p, "writable", false);
    prop.construct_only = j_bool(p, "construct_only", false);
    cls.properties.push_back(std::move(prop));
  }
  for (const auto & f : j_array(j, "fields")) {
    RawField field;
    field.name = f.at("name").get<std::string>();
    field.type = r_type_at(f, "type");
    field.writable = j_bool(f, "writable", true);
    cls.fields.push_back(std::move(field));
  }
  return cls;
}

RawEnum r_enum(const json & j, bool is_bitfield)
{
  RawEnum en;
  en.name = j.at("name").get<std::string>();
  en.c_type = j_string(j, "c_type");
  en.is_bitfield = is_bitfield;
  for (const auto & m : j_array(j, "members")) {
    en.members.push_back(
      RawEnumMember{m.at("name").get<std::string>(), m.value("value", int64_t{0})});
  }
  return en;
}

RawNamespace r_namespace(const json & doc)
{
  RawNamespace ns;
  ns.name = doc.at("name").get<std::string>();
  ns.version = doc.at("version").get<std::string>();
  ns.c_prefix = j_string(doc, "c_prefix");

  for (const auto & inc : j_array(doc, "includes")) {
    ns.includes.push_back(
      RawInclude{inc.at("name").get<std::string>(), inc.at("version").get<std::string>()});
  }
  for (const auto & c : j_array(doc, "classes")) ns.classes.push_back(r_class(c));
  for (const auto & c : j_array(doc, "interfaces")) ns.interfaces.push_back(r_class(c));
  for (const auto & c : j_array(doc, "records")) ns.records.push_back(r_class(c));
  for (const auto & e : j_array(doc, "enums")) ns.enums.push_back(r_enum(e, false));
  for (const auto & e : j_array(doc, "bitfields")) ns.enums.push_back(r_enum(e, true));
  ns.functions = r_callables(doc, "functions");
  ns.callbacks = r_callables(doc, "callbacks");

  for (const auto & c : j_array(doc, "constants")) {
    RawConstant constant;
    constant.name = c.at("name").get<std::string>();
    constant.type = r_type_at(c, "type");
    if (auto it = c.find("value"); it != c.end()) {
      constant.value = it->is_string() ? it->get<std::string>() : it->dump();
    }
    ns.constants.push_back(std::move(constant));
  }
  for (const auto & a : j_array(doc, "aliases")) {
    ns.aliases.push_back(
      RawAlias{a.at("name").get<std::string>(), j_string(a, "c_type"), r_type_at(a, "target")});
  }
  return ns;
}

}  // namespace

RawTreeLoadResult JsonRawTreeReader::from_json(const nlohmann::json & doc)
{
  if (!doc.is_object()) {
    return RawTreeLoadResult::fail("raw tree must be a JSON object");
  }
  try {
    return RawTreeLoadResult::ok(r_namespace(doc));
  } catch (const nlohmann::json::exception & e) {
    return RawTreeLoadResult::fail(std::string("malformed raw tree: ") + e.what());
  } catch (const std::invalid_argument & e) {
    return RawTreeLoadResult::fail(std::string("malformed raw tree: ") + e.what());
  }
}

RawTreeLoadResult JsonRawTreeReader::parse(const std::string & text)
{
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error & e) {
    return RawTreeLoadResult::fail(std::string("invalid JSON: ") + e.what());
  }
  return from_json(doc);
}

RawTreeLoadResult JsonRawTreeReader::read(const std::filesystem::path & path) const
{
  std::ifstream in(path);
  if (!in) {
    return RawTreeLoadResult::fail("cannot open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  RawTreeLoadResult result = parse(buffer.str());
  if (!result.success) {
    result.error = path.filename().string() + ": " + result.error;
  }
  return result;
}

}  // namespace gir_model
