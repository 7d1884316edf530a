// gir_model/sema/class_hierarchy.hpp - Ancestor index over resolved classes
//
// Built once after resolution. All queries are read-only, so the index can be
// shared by the per-namespace conflict analysis tasks.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "gir_model/model/model.hpp"

namespace gir_model
{

class ClassHierarchy
{
public:
  explicit ClassHierarchy(const Model & model);

  /// The declaration a resolved reference names, if it is a class/interface/record
  [[nodiscard]] const BaseClass * class_of(const TypeExpr * type) const;

  /// Direct parents: super type first, then implemented interfaces in declaration order
  [[nodiscard]] const std::vector<const BaseClass *> & parents(const BaseClass & cls) const;

  /**
   * Every transitive ancestor, breadth first, each listed once.
   * The class itself is never listed, even when the graph is cyclic.
   */
  [[nodiscard]] const std::vector<const BaseClass *> & ancestors(const BaseClass & cls) const;

  /// True when `ancestor` is reachable from `cls` through super/interface chains
  [[nodiscard]] bool derives_from(const BaseClass & cls, const BaseClass & ancestor) const;

  /// True when `cls` is, or derives from, the class named `qualified` ("GObject.Object")
  [[nodiscard]] bool rooted_at(const BaseClass & cls, std::string_view qualified) const;

private:
  void compute_ancestors(const BaseClass & cls);

  const Model & model_;
  std::unordered_map<const BaseClass *, std::vector<const BaseClass *>> parents_;
  std::unordered_map<const BaseClass *, std::vector<const BaseClass *>> ancestors_;
  std::vector<const BaseClass *> empty_;
};

}  // namespace gir_model
