#pragma once

#include <modelflow/app/config.hpp>
#include <modelflow/model/model_spec.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <modelflow/workflow/workflow.hpp>

namespace modelflow::app {

/// Model spec for the configured engine. The mock engine stands in for a
/// random forest and keeps factor predictors unexpanded.
[[nodiscard]] model::ModelSpec make_model_spec(const WorkflowConfig& cfg);

/// Formula preprocessor for the config. A set `indicators` makes a user
/// blueprint; `auto` leaves indicators to the model, with `intercept` carried
/// in the base blueprint.
[[nodiscard]] workflow::FormulaAction make_formula_action(const WorkflowConfig& cfg,
                                                          preprocess::Formula formula);

}  // namespace modelflow::app
