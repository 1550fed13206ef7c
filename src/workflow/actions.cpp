#include <modelflow/workflow/actions.hpp>
#include <modelflow/workflow/stages.hpp>
#include "workflow_access.hpp"

namespace modelflow::workflow {

using core::WorkflowError;

std::expected<Workflow, WorkflowError> add_preprocessor(const Workflow& w,
                                                        PreprocessorAction action,
                                                        DuplicatePolicy policy) {
  if (const auto& existing = w.preprocessor()) {
    const bool same_kind = existing->index() == action.index();
    if (policy == DuplicatePolicy::Strict ||
        (policy == DuplicatePolicy::Replace && !same_kind)) {
      return std::unexpected(WorkflowError::DuplicatePreprocessor);
    }
  }
  Workflow out = w;
  detail::WorkflowAccess::set_preprocessor(out, std::move(action));
  return out;
}

std::expected<Workflow, WorkflowError> add_formula(
    const Workflow& w,
    preprocess::Formula formula,
    std::optional<preprocess::FormulaBlueprint> blueprint,
    DuplicatePolicy policy) {
  const auto bp = blueprint.value_or(preprocess::default_formula_blueprint());
  FormulaAction action{std::move(formula), bp, blueprint.has_value(), bp};
  return add_preprocessor(w, std::move(action), policy);
}

std::expected<Workflow, WorkflowError> add_recipe(
    const Workflow& w,
    preprocess::Recipe recipe,
    std::optional<preprocess::RecipeBlueprint> blueprint,
    DuplicatePolicy policy) {
  RecipeAction action{std::move(recipe),
                      blueprint.value_or(preprocess::default_recipe_blueprint()),
                      blueprint.has_value()};
  return add_preprocessor(w, std::move(action), policy);
}

std::expected<Workflow, WorkflowError> add_model(const Workflow& w,
                                                 model::ModelSpec spec,
                                                 DuplicatePolicy policy) {
  if (has_spec(w) && policy == DuplicatePolicy::Strict) {
    return std::unexpected(WorkflowError::DuplicateModel);
  }
  Workflow out = w;
  detail::WorkflowAccess::set_model(out, ModelAction{std::move(spec), "model"});
  return out;
}

}  // namespace modelflow::workflow
