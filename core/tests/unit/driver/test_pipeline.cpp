// tests/unit/driver/test_pipeline.cpp - Unit tests for the model building pipeline
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "gir_model/driver/pipeline.hpp"
#include "gir_model/test_support/model_builders.hpp"

using namespace gir_model;
using namespace gir_model::test_support;

namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;

  explicit TempDir(const std::string & name) : path(fs::temp_directory_path() / name)
  {
    std::error_code ec;
    fs::remove_all(path, ec);
    fs::create_directories(path);
  }

  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  void write(const fs::path & rel, const std::string & content) const
  {
    const fs::path full = path / rel;
    fs::create_directories(full.parent_path());
    std::ofstream out(full);
    out << content;
  }
};

const char * const k_gobject_tree = R"({
  "name": "GObject", "version": "2.0",
  "classes": [{
    "name": "Object", "c_type": "GObject",
    "methods": [
      {"name": "connect", "parameters": [{"name": "signal", "type": "utf8"}],
       "return_type": "gulong"},
      {"name": "emit", "parameters": [{"name": "signal", "type": "utf8"}]}
    ]
  }]
})";

const char * const k_demo_tree = R"({
  "name": "Demo", "version": "1.0",
  "includes": [{"name": "GObject", "version": "2.0"}],
  "classes": [
    {"name": "Base", "parent": "GObject.Object",
     "methods": [{"name": "f", "return_type": "utf8"}]},
    {"name": "Derived", "parent": "Base",
     "methods": [{"name": "f", "parameters": [{"name": "a", "type": "gint"}],
                  "return_type": "utf8"}]}
  ]
})";

/// Base.f() and Derived.f(a) plus a class redeclaring the reserved `connect`
RawNamespace raw_demo()
{
  RawNamespace ns = raw_namespace("Demo", "1.0");
  ns.includes.push_back(RawInclude{"GObject", "2.0"});

  RawClass base = raw_class("Base", "GObject.Object");
  base.methods.push_back(raw_callable("f", {}, raw_type("utf8")));
  RawClass derived = raw_class("Derived", "Base");
  derived.methods.push_back(
    raw_callable("f", {raw_param("a", raw_type("gint"))}, raw_type("utf8")));
  RawClass emitter = raw_class("Emitter", "GObject.Object");
  emitter.methods.push_back(raw_callable(
    "connect", {raw_param("signal", raw_type("utf8")), raw_param("data", raw_type("gpointer"))},
    raw_type("gulong")));

  ns.classes.push_back(std::move(base));
  ns.classes.push_back(std::move(derived));
  ns.classes.push_back(std::move(emitter));
  return ns;
}

ProjectConfig config_for(const fs::path & root)
{
  ProjectConfig config;
  config.project_root = root;
  config.search_dirs = {root / "gir"};
  config.report.output = root / "out" / "report.json";
  return config;
}

}  // namespace

// ============================================================================
// Configuration mapping
// ============================================================================

TEST(DriverPipeline, HooksAndConflictOptions)
{
  ProjectConfig config;
  EXPECT_EQ(Pipeline::make_hooks(config).size(), 24U);

  ScopedCorrection correction;
  correction.ns = "Demo";
  correction.version = "1.0";
  correction.class_name = "Holder";
  correction.member = "handler";
  correction.container = "Holder";
  correction.name = "Handler";
  config.scoped_corrections.push_back(correction);
  EXPECT_EQ(Pipeline::make_hooks(config).size(), 25U);

  config.universal_base = "GObject.InitiallyUnowned";
  config.reserved_members = {"emit"};
  config.known_conflicts["Gtk"] = {"get_style"};
  const ConflictOptions options = Pipeline::conflict_options(config);
  EXPECT_EQ(options.universal_base, "GObject.InitiallyUnowned");
  EXPECT_EQ(options.reserved_members.size(), 1U);
  EXPECT_EQ(options.known_conflicts.at("Gtk").count("get_style"), 1U);
}

// ============================================================================
// From raw trees
// ============================================================================

TEST(DriverPipeline, RunTrees)
{
  ProjectConfig config;
  auto result = Pipeline::run_trees({raw_gobject(), raw_demo()}, config);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.model.size(), 2U);
  EXPECT_EQ(result.model.namespaces()[0]->name(), "GObject");

  ASSERT_EQ(result.records.size(), 2U);
  EXPECT_EQ(result.records[0].class_name, "Derived");
  EXPECT_EQ(result.records[0].resolution, ConflictResolution::Overloaded);
  EXPECT_EQ(result.records[1].class_name, "Emitter");
  EXPECT_EQ(result.records[1].member, "connect");
  EXPECT_EQ(result.records[1].ancestor, "GObject.Object");

  EXPECT_EQ(result.diagnostics.with_code("C005").size(), 2U);
  EXPECT_FALSE(result.diagnostics.has_errors());

  // Conflicts are applied to the model
  const BaseClass * derived = result.model.find("Demo")->find_class("Derived");
  ASSERT_NE(derived, nullptr);
  ASSERT_EQ(derived->members.size(), 2U);
  EXPECT_TRUE(derived->members[1].synthesized);
}

TEST(DriverPipeline, KnownConflictsFromConfig)
{
  ProjectConfig config;
  config.known_conflicts["Demo"] = {"f"};

  RawNamespace demo = raw_namespace("Demo", "1.0");
  RawClass lone = raw_class("Lone");
  lone.methods.push_back(raw_callable("f"));
  demo.classes.push_back(std::move(lone));

  auto result = Pipeline::run_trees({std::move(demo)}, config);
  ASSERT_EQ(result.records.size(), 1U);
  EXPECT_TRUE(result.records[0].ancestor.empty());
  EXPECT_EQ(
    result.model.find("Demo")->find_class("Lone")->members[1].note,
    "conflicted with a known problematic member 'f'");
}

TEST(DriverPipeline, JobCountDoesNotChangeTheResult)
{
  ProjectConfig serial;
  serial.jobs = 1;
  ProjectConfig parallel;
  parallel.jobs = 4;

  auto a = Pipeline::run_trees({raw_gobject(), raw_demo()}, serial);
  auto b = Pipeline::run_trees({raw_gobject(), raw_demo()}, parallel);

  EXPECT_EQ(a.records, b.records);
  EXPECT_EQ(a.diagnostics.size(), b.diagnostics.size());
}

// ============================================================================
// Full runs
// ============================================================================

TEST(DriverPipeline, NoModulesRequested)
{
  ProjectConfig config;
  const JsonRawTreeReader reader{};
  auto result = Pipeline::run(config, reader);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.with_code("P001").size(), 1U);
  EXPECT_EQ(result.diagnostics.with_code("P001")[0].message, "no modules requested");
}

TEST(DriverPipeline, RunWritesReport)
{
  TempDir dir("gir_model_pipeline_report");
  dir.write("gir/GObject-2.0.gir.json", k_gobject_tree);
  dir.write("gir/Demo-1.0.gir.json", k_demo_tree);

  ProjectConfig config = config_for(dir.path);
  config.modules = {"Demo-1.0"};
  config.report.enabled = true;

  const JsonRawTreeReader reader{};
  auto result = Pipeline::run(config, reader);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.model.size(), 2U);
  EXPECT_EQ(result.model.namespaces()[0]->name(), "GObject");
  EXPECT_EQ(result.model.namespaces()[1]->name(), "Demo");
  EXPECT_EQ(result.groups.size(), 2U);
  EXPECT_EQ(result.records.size(), 1U);

  ASSERT_TRUE(result.report_path.has_value());
  EXPECT_EQ(*result.report_path, dir.path / "out" / "report.json");
  std::ifstream in(*result.report_path);
  ASSERT_TRUE(in.good());
  const nlohmann::json report = nlohmann::json::parse(in);
  EXPECT_EQ(report["summary"]["conflicts"], 1);
  EXPECT_EQ(report["conflicts"][0]["member"], "f");
}

TEST(DriverPipeline, ReportCanBeSuppressed)
{
  TempDir dir("gir_model_pipeline_no_report");
  dir.write("gir/GObject-2.0.gir.json", k_gobject_tree);

  ProjectConfig config = config_for(dir.path);
  config.modules = {"GObject"};
  config.report.enabled = true;

  PipelineOptions options;
  options.write_report = false;

  const JsonRawTreeReader reader{};
  auto result = Pipeline::run(config, reader, options);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.report_path.has_value());
  EXPECT_FALSE(fs::exists(config.report.output));
}

TEST(DriverPipeline, ConflictingGroupStillBuildsTheRest)
{
  TempDir dir("gir_model_pipeline_conflict");
  dir.write("gir/GObject-2.0.gir.json", k_gobject_tree);
  dir.write("gir/Demo-1.0.gir.json", k_demo_tree);
  dir.write("gir/N-1.0.gir.json", R"({"name": "N", "version": "1.0"})");
  dir.write("gir/N-2.0.gir.json", R"({"name": "N", "version": "2.0"})");

  ProjectConfig config = config_for(dir.path);
  config.modules = {"Demo", "N"};

  const JsonRawTreeReader reader{};
  auto result = Pipeline::run(config, reader);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.with_code("M003").size(), 1U);
  EXPECT_EQ(result.model.size(), 2U);
  EXPECT_EQ(result.model.find("N"), nullptr);
  EXPECT_NE(result.model.find("Demo"), nullptr);
}

TEST(DriverPipeline, CycleBuildsNothing)
{
  TempDir dir("gir_model_pipeline_cycle");
  dir.write(
    "gir/A-1.0.gir.json",
    R"({"name": "A", "version": "1.0", "includes": [{"name": "B", "version": "1.0"}]})");
  dir.write(
    "gir/B-1.0.gir.json",
    R"({"name": "B", "version": "1.0", "includes": [{"name": "A", "version": "1.0"}]})");

  ProjectConfig config = config_for(dir.path);
  config.modules = {"A"};

  const JsonRawTreeReader reader{};
  auto result = Pipeline::run(config, reader);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.model.size(), 0U);
  EXPECT_EQ(result.diagnostics.with_code("M007").size(), 1U);
}
