// gir_model/sema/class_hierarchy.cpp - Ancestor index
#include "gir_model/sema/class_hierarchy.hpp"

#include <algorithm>
#include <deque>
#include <utility>
#include <unordered_set>

namespace gir_model
{

ClassHierarchy::ClassHierarchy(const Model & model) : model_(model)
{
  for (const auto & ns : model_) {
    for (const auto & cls : ns->classes) {
      auto & direct = parents_[cls.get()];
      if (cls->super_type) {
        if (const BaseClass * super = class_of(cls->super_type->resolved)) {
          direct.push_back(super);
        }
      }
      for (const auto & iface : cls->interfaces) {
        const BaseClass * parent = class_of(iface.resolved);
        if (parent != nullptr && std::find(direct.begin(), direct.end(), parent) == direct.end()) {
          direct.push_back(parent);
        }
      }
    }
  }

  for (const auto & ns : model_) {
    for (const auto & cls : ns->classes) {
      compute_ancestors(*cls);
    }
  }
}

const BaseClass * ClassHierarchy::class_of(const TypeExpr * type) const
{
  if (type == nullptr) {
    return nullptr;
  }
  switch (type->kind) {
    case TypeExprKind::Identifier:
      return model_.find_class(type->ns, type->name);
    case TypeExprKind::Generified:
    case TypeExprKind::ConflictMarker:
    case TypeExprKind::Nullable:
      return class_of(type->inner);
    default:
      return nullptr;
  }
}

const std::vector<const BaseClass *> & ClassHierarchy::parents(const BaseClass & cls) const
{
  auto it = parents_.find(&cls);
  return it == parents_.end() ? empty_ : it->second;
}

const std::vector<const BaseClass *> & ClassHierarchy::ancestors(const BaseClass & cls) const
{
  auto it = ancestors_.find(&cls);
  return it == ancestors_.end() ? empty_ : it->second;
}

void ClassHierarchy::compute_ancestors(const BaseClass & cls)
{
  std::vector<const BaseClass *> result;
  std::unordered_set<const BaseClass *> visited{&cls};
  std::deque<const BaseClass *> queue;

  for (const BaseClass * p : parents(cls)) {
    queue.push_back(p);
  }
  while (!queue.empty()) {
    const BaseClass * current = queue.front();
    queue.pop_front();
    if (!visited.insert(current).second) {
      continue;
    }
    result.push_back(current);
    for (const BaseClass * p : parents(*current)) {
      queue.push_back(p);
    }
  }

  ancestors_[&cls] = std::move(result);
}

bool ClassHierarchy::derives_from(const BaseClass & cls, const BaseClass & ancestor) const
{
  const auto & list = ancestors(cls);
  return std::find(list.begin(), list.end(), &ancestor) != list.end();
}

bool ClassHierarchy::rooted_at(const BaseClass & cls, std::string_view qualified) const
{
  if (cls.qualified_name() == qualified) {
    return true;
  }
  const auto & list = ancestors(cls);
  return std::any_of(list.begin(), list.end(), [qualified](const BaseClass * a) {
    return a->qualified_name() == qualified;
  });
}

}  // namespace gir_model
