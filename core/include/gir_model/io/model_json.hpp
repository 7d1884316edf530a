// gir_model/io/model_json.hpp - JSON export of the resolved model
//
// The export is the hand-off to the rendering collaborator: namespaces in
// load order with every slot resolved and conflict annotations attached.
//
#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/model.hpp"
#include "gir_model/registry/module_registry.hpp"
#include "gir_model/sema/conflict_detector.hpp"

namespace gir_model
{

/// Printable type form, or null for an unresolved slot
[[nodiscard]] nlohmann::json type_to_json(const TypeExpr * type);

/// One namespace with all of its declarations
[[nodiscard]] nlohmann::json namespace_to_json(const Namespace & ns);

/**
 * Serialize the model.
 *
 * @param model Namespaces in load order
 * @param groups Module groups; Conflicting and Failed ones are listed separately
 */
[[nodiscard]] nlohmann::json model_to_json(
  const Model & model, const std::vector<ModuleGroup> & groups = {});

[[nodiscard]] nlohmann::json groups_to_json(const std::vector<ModuleGroup> & groups);

[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic & diag);

/// Conflict records and diagnostics (the report file)
[[nodiscard]] nlohmann::json report_to_json(
  const std::vector<ConflictRecord> & records, const DiagnosticBag & diags);

}  // namespace gir_model
