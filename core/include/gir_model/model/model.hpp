// gir_model/model/model.hpp - The set of participating namespaces in load order
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "gir_model/model/namespace.hpp"

namespace gir_model
{

/**
 * Owns every participating Namespace.
 *
 * Namespaces are kept in load order (dependencies first). At most one version
 * of a namespace name participates, so lookups are by name.
 */
class Model
{
public:
  Model() = default;

  Model(const Model &) = delete;
  Model & operator=(const Model &) = delete;
  Model(Model &&) = default;
  Model & operator=(Model &&) = default;

  Namespace & add(std::unique_ptr<Namespace> ns);

  [[nodiscard]] Namespace * find(std::string_view name);
  [[nodiscard]] const Namespace * find(std::string_view name) const;

  /// Look up a class/interface/record by namespace and name
  [[nodiscard]] const BaseClass * find_class(std::string_view ns, std::string_view name) const;

  [[nodiscard]] const std::vector<std::unique_ptr<Namespace>> & namespaces() const noexcept
  {
    return namespaces_;
  }
  [[nodiscard]] size_t size() const noexcept { return namespaces_.size(); }
  [[nodiscard]] bool empty() const noexcept { return namespaces_.empty(); }

  [[nodiscard]] auto begin() const { return namespaces_.begin(); }
  [[nodiscard]] auto end() const { return namespaces_.end(); }

private:
  std::vector<std::unique_ptr<Namespace>> namespaces_;
};

}  // namespace gir_model
