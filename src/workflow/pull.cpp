#include <modelflow/workflow/pull.hpp>
#include <modelflow/core/overloaded.hpp>
#include <modelflow/workflow/stages.hpp>

namespace modelflow::workflow {

using core::WorkflowError;

std::expected<Preprocessor, WorkflowError> pull_preprocessor(const Workflow& w) {
  if (!has_preprocessor(w)) {
    return std::unexpected(WorkflowError::PreprocessorNotPresent);
  }
  return std::visit(
      core::Overloaded{
          [](const FormulaAction& a) -> Preprocessor { return a.formula; },
          [](const RecipeAction& a) -> Preprocessor { return a.recipe; },
      },
      *w.preprocessor());
}

std::expected<model::ModelSpec, WorkflowError> pull_spec(const Workflow& w) {
  if (!has_spec(w)) {
    return std::unexpected(WorkflowError::SpecNotPresent);
  }
  return w.model()->spec;
}

std::expected<model::ModelFit, WorkflowError> pull_fit(const Workflow& w) {
  if (!has_fit(w)) {
    return std::unexpected(WorkflowError::FitNotPresent);
  }
  return *w.fit();
}

std::expected<preprocess::Mold, WorkflowError> pull_mold(const Workflow& w) {
  if (!has_mold(w)) {
    return std::unexpected(WorkflowError::MoldNotPresent);
  }
  return *w.mold();
}

std::expected<preprocess::PreppedRecipe, WorkflowError> pull_prepped_recipe(
    const Workflow& w) {
  if (!has_preprocessor_recipe(w)) {
    return std::unexpected(WorkflowError::WrongPreprocessorKind);
  }
  auto mold = pull_mold(w);
  if (!mold) {
    return std::unexpected(mold.error());
  }
  if (!mold->recipe) {
    return std::unexpected(WorkflowError::MoldNotPresent);
  }
  return *mold->recipe;
}

}  // namespace modelflow::workflow
