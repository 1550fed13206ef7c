#include <modelflow/preprocess/recipe.hpp>
#include <algorithm>

namespace modelflow::preprocess {

using core::WorkflowError;

namespace {

std::expected<data::Table, WorkflowError> select_roles(
    const data::Table& input,
    const std::vector<std::string>& predictors,
    const std::vector<std::string>& outcomes,
    bool include_outcomes) {
  std::vector<std::string> names = predictors;
  if (include_outcomes) {
    names.insert(names.end(), outcomes.begin(), outcomes.end());
  }
  return input.select(names);
}

}  // namespace

std::expected<Recipe, WorkflowError> Recipe::create(
    const Formula& formula, const data::Table& template_data) {
  auto terms = formula.resolve_predictors(template_data);
  if (!terms) {
    return std::unexpected(terms.error());
  }
  Recipe r;
  r.outcomes_ = formula.outcomes();
  for (const auto& term : *terms) {
    if (term.transform != TermTransform::Identity) {
      return std::unexpected(WorkflowError::InvalidFormula);
    }
    r.predictors_.push_back(term.column);
  }
  return r;
}

Recipe Recipe::add_step(StepPtr step) const {
  Recipe r = *this;
  if (step) {
    r.steps_.push_back(std::move(step));
  }
  return r;
}

std::expected<PreppedRecipe, WorkflowError> prep(const Recipe& recipe,
                                                 const data::Table& training) {
  auto current = select_roles(training, recipe.predictors(), recipe.outcomes(), true);
  if (!current) {
    return std::unexpected(current.error());
  }

  PreppedRecipe out;
  out.outcomes_ = recipe.outcomes();
  out.raw_predictors_ = recipe.predictors();
  out.steps_.reserve(recipe.steps().size());
  for (const auto& step : recipe.steps()) {
    auto trained = step->prep(*current);
    if (!trained) {
      return std::unexpected(trained.error());
    }
    if (!*trained || !(*trained)->trained()) {
      return std::unexpected(WorkflowError::RecipeStepFailed);
    }
    auto baked = (*trained)->bake(*current);
    if (!baked) {
      return std::unexpected(baked.error());
    }
    current = std::move(*baked);
    out.steps_.push_back(std::move(*trained));
  }

  for (const auto& name : current->names()) {
    if (std::find(out.outcomes_.begin(), out.outcomes_.end(), name) == out.outcomes_.end()) {
      out.predictors_.push_back(name);
    }
  }
  return out;
}

std::expected<data::Table, WorkflowError> PreppedRecipe::bake(
    const data::Table& new_data, bool include_outcomes) const {
  auto current = select_roles(new_data, raw_predictors_, outcomes_, include_outcomes);
  if (!current) {
    return std::unexpected(current.error());
  }
  for (const auto& step : steps_) {
    auto baked = step->bake(*current);
    if (!baked) {
      return std::unexpected(baked.error());
    }
    current = std::move(*baked);
  }
  return current;
}

}  // namespace modelflow::preprocess
