#pragma once

#include <modelflow/model/model_spec.hpp>
#include <modelflow/preprocess/blueprint.hpp>
#include <modelflow/workflow/workflow.hpp>

namespace modelflow::workflow {

/// Effective formula blueprint: a default blueprint starts from the action's
/// base_blueprint and takes the model spec's indicator preference when the
/// model spec reports one; a user blueprint is returned unchanged. spec may be
/// null.
[[nodiscard]] preprocess::FormulaBlueprint resolve_formula_blueprint(
    const FormulaAction& action, const model::ModelSpec* spec);

/// Effective blueprint for any preprocessor. Recipes ignore the model's
/// preferences and always keep their own blueprint.
[[nodiscard]] preprocess::Blueprint resolve_blueprint(
    const PreprocessorAction& action, const model::ModelSpec* spec);

}  // namespace modelflow::workflow
