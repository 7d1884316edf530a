// gir_model/model/model.cpp - Model container
#include "gir_model/model/model.hpp"

#include <utility>

namespace gir_model
{

Namespace & Model::add(std::unique_ptr<Namespace> ns)
{
  namespaces_.push_back(std::move(ns));
  return *namespaces_.back();
}

Namespace * Model::find(std::string_view name)
{
  for (auto & ns : namespaces_) {
    if (ns->name() == name) {
      return ns.get();
    }
  }
  return nullptr;
}

const Namespace * Model::find(std::string_view name) const
{
  for (const auto & ns : namespaces_) {
    if (ns->name() == name) {
      return ns.get();
    }
  }
  return nullptr;
}

const BaseClass * Model::find_class(std::string_view ns, std::string_view name) const
{
  const Namespace * target = find(ns);
  if (target == nullptr) {
    return nullptr;
  }
  return target->find_class(name);
}

}  // namespace gir_model
