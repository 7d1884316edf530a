// tests/unit/io/test_raw_tree_reader.cpp - Unit tests for JsonRawTreeReader
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "gir_model/io/raw_tree_reader.hpp"

using namespace gir_model;

namespace fs = std::filesystem;

namespace
{

const char * const k_gtk_tree = R"({
  "name": "Gtk",
  "version": "4.0",
  "c_prefix": "Gtk",
  "includes": [{"name": "GObject", "version": "2.0"}],
  "classes": [
    {
      "name": "Widget",
      "c_type": "GtkWidget",
      "parent": "GObject.InitiallyUnowned",
      "implements": ["Buildable"],
      "constructors": [{"name": "new", "return_type": "Widget"}],
      "methods": [
        {
          "name": "get_size",
          "parameters": [
            {"name": "orientation", "type": {"name": "Orientation", "c_type": "GtkOrientation"}},
            {"name": "size", "type": "gint", "direction": "out"}
          ],
          "return_type": {"name": "gboolean"}
        },
        {"name": "hidden", "introspectable": false}
      ],
      "virtual_methods": [{"name": "snapshot"}],
      "properties": [
        {"name": "css-classes", "type": {"name": "utf8", "array": true, "nullable": true},
         "writable": true}
      ],
      "fields": [{"name": "parent_instance", "type": "GObject.InitiallyUnowned", "writable": false}],
      "callbacks": [{"name": "TickCallback", "return_type": "gboolean"}]
    }
  ],
  "interfaces": [{"name": "Buildable", "prerequisites": ["GObject.Object"]}],
  "records": [{"name": "Border", "fields": [{"name": "left", "type": "gint16"}]}],
  "enums": [{"name": "Orientation", "c_type": "GtkOrientation",
             "members": [{"name": "horizontal", "value": 0}, {"name": "vertical", "value": 1}]}],
  "bitfields": [{"name": "StateFlags", "members": [{"name": "active", "value": 1}]}],
  "functions": [{"name": "init"}],
  "callbacks": [{"name": "Callback", "parameters": [{"name": "widget", "type": "Widget"}]}],
  "constants": [{"name": "MAJOR_VERSION", "type": "gint", "value": 4},
                {"name": "NAME", "type": "utf8", "value": "gtk"}],
  "aliases": [{"name": "Allocation", "c_type": "GtkAllocation", "target": "Gdk.Rectangle"}]
})";

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(IoRawTreeReader, ParsesFullTree)
{
  auto result = JsonRawTreeReader::parse(k_gtk_tree);
  ASSERT_TRUE(result.success) << result.error;
  const RawNamespace & ns = result.tree;

  EXPECT_EQ(ns.name, "Gtk");
  EXPECT_EQ(ns.version, "4.0");
  ASSERT_EQ(ns.includes.size(), 1U);
  EXPECT_EQ(ns.includes[0].name, "GObject");

  ASSERT_EQ(ns.classes.size(), 1U);
  const RawClass & widget = ns.classes[0];
  EXPECT_EQ(widget.c_type, "GtkWidget");
  EXPECT_EQ(widget.parent, "GObject.InitiallyUnowned");
  ASSERT_EQ(widget.implements.size(), 1U);
  ASSERT_EQ(widget.constructors.size(), 1U);
  EXPECT_EQ(widget.constructors[0].return_type.name, "Widget");

  ASSERT_EQ(widget.methods.size(), 2U);
  const RawCallable & get_size = widget.methods[0];
  ASSERT_EQ(get_size.parameters.size(), 2U);
  EXPECT_EQ(get_size.parameters[0].type.c_type, "GtkOrientation");
  EXPECT_EQ(get_size.parameters[0].direction, Direction::In);
  EXPECT_EQ(get_size.parameters[1].direction, Direction::Out);
  EXPECT_EQ(get_size.parameters[1].type.name, "gint");
  EXPECT_TRUE(get_size.introspectable);
  EXPECT_FALSE(widget.methods[1].introspectable);
  EXPECT_TRUE(widget.methods[1].return_type.empty());

  ASSERT_EQ(widget.properties.size(), 1U);
  const RawProperty & css = widget.properties[0];
  EXPECT_EQ(css.type.array_depth, 1U);
  EXPECT_TRUE(css.type.nullable);
  EXPECT_TRUE(css.readable);
  EXPECT_TRUE(css.writable);

  ASSERT_EQ(widget.fields.size(), 1U);
  EXPECT_FALSE(widget.fields[0].writable);
  ASSERT_EQ(widget.callbacks.size(), 1U);

  ASSERT_EQ(ns.interfaces.size(), 1U);
  EXPECT_EQ(ns.interfaces[0].implements.front(), "GObject.Object");
  ASSERT_EQ(ns.records.size(), 1U);
  EXPECT_TRUE(ns.records[0].fields[0].writable);

  ASSERT_EQ(ns.enums.size(), 2U);
  EXPECT_FALSE(ns.enums[0].is_bitfield);
  EXPECT_EQ(ns.enums[0].members[1].value, 1);
  EXPECT_TRUE(ns.enums[1].is_bitfield);

  ASSERT_EQ(ns.constants.size(), 2U);
  EXPECT_EQ(ns.constants[0].value, "4");
  EXPECT_EQ(ns.constants[1].value, "gtk");
  ASSERT_EQ(ns.aliases.size(), 1U);
  EXPECT_EQ(ns.aliases[0].target.name, "Gdk.Rectangle");
}

TEST(IoRawTreeReader, ArrayDepth)
{
  auto result = JsonRawTreeReader::parse(R"({
    "name": "T", "version": "1",
    "functions": [{"name": "f", "return_type": {"name": "utf8", "array": 2,
                    "type_arguments": ["gint"]}}]
  })");
  ASSERT_TRUE(result.success) << result.error;
  const RawTypeRef & ret = result.tree.functions[0].return_type;
  EXPECT_EQ(ret.array_depth, 2U);
  ASSERT_EQ(ret.type_arguments.size(), 1U);
  EXPECT_EQ(ret.type_arguments[0].name, "gint");
}

// ============================================================================
// Errors
// ============================================================================

TEST(IoRawTreeReader, Errors)
{
  auto invalid = JsonRawTreeReader::parse("{ nope");
  EXPECT_FALSE(invalid.success);
  EXPECT_EQ(invalid.error.rfind("invalid JSON", 0), 0U);

  auto not_object = JsonRawTreeReader::parse("[1, 2]");
  EXPECT_FALSE(not_object.success);
  EXPECT_EQ(not_object.error, "raw tree must be a JSON object");

  auto missing_version = JsonRawTreeReader::parse(R"({"name": "T"})");
  EXPECT_FALSE(missing_version.success);
  EXPECT_EQ(missing_version.error.rfind("malformed raw tree", 0), 0U);

  auto bad_direction = JsonRawTreeReader::parse(R"({
    "name": "T", "version": "1",
    "functions": [{"name": "f", "parameters": [{"name": "a", "direction": "sideways"}]}]
  })");
  EXPECT_FALSE(bad_direction.success);
  EXPECT_NE(bad_direction.error.find("sideways"), std::string::npos);
}

// ============================================================================
// Files
// ============================================================================

TEST(IoRawTreeReader, ReadFile)
{
  const fs::path dir = fs::temp_directory_path() / "gir_model_raw_tree_reader";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  {
    std::ofstream out(dir / "Gtk-4.0.gir.json");
    out << k_gtk_tree;
  }
  {
    std::ofstream out(dir / "Broken-1.0.gir.json");
    out << "{";
  }

  const JsonRawTreeReader reader{};
  auto ok = reader.read(dir / "Gtk-4.0.gir.json");
  EXPECT_TRUE(ok.success) << ok.error;
  EXPECT_EQ(ok.tree.name, "Gtk");

  auto broken = reader.read(dir / "Broken-1.0.gir.json");
  EXPECT_FALSE(broken.success);
  EXPECT_EQ(broken.error.rfind("Broken-1.0.gir.json: invalid JSON", 0), 0U);

  auto missing = reader.read(dir / "Missing-1.0.gir.json");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error.rfind("cannot open", 0), 0U);

  fs::remove_all(dir, ec);
}
