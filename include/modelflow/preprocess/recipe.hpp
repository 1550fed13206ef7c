#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modelflow::preprocess {

/// Abstract recipe step. Untrained steps are prepped on training data, which
/// yields a new trained step; trained steps are immutable and may be shared
/// between workflow copies.
class RecipeStep {
 public:
  virtual ~RecipeStep() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual bool trained() const noexcept = 0;

  /// Estimate the step's parameters from training data.
  [[nodiscard]] virtual std::expected<std::shared_ptr<const RecipeStep>,
                                      core::WorkflowError>
  prep(const data::Table& training) const = 0;

  /// Apply a trained step.
  [[nodiscard]] virtual std::expected<data::Table, core::WorkflowError> bake(
      const data::Table& input) const = 0;
};

using StepPtr = std::shared_ptr<const RecipeStep>;

/// Untrained recipe: variable roles plus an ordered list of steps.
class Recipe {
 public:
  /// Assign outcome and predictor roles from a formula over template data.
  /// Terms must be plain columns; transformations belong in steps.
  [[nodiscard]] static std::expected<Recipe, core::WorkflowError> create(
      const Formula& formula, const data::Table& template_data);

  [[nodiscard]] Recipe add_step(StepPtr step) const;

  [[nodiscard]] const std::vector<std::string>& outcomes() const noexcept {
    return outcomes_;
  }
  [[nodiscard]] const std::vector<std::string>& predictors() const noexcept {
    return predictors_;
  }
  [[nodiscard]] const std::vector<StepPtr>& steps() const noexcept { return steps_; }

  bool operator==(const Recipe&) const = default;

 private:
  Recipe() = default;

  std::vector<std::string> outcomes_;
  std::vector<std::string> predictors_;
  std::vector<StepPtr> steps_;
};

/// Recipe whose steps have been trained on a specific dataset.
class PreppedRecipe {
 public:
  [[nodiscard]] const std::vector<std::string>& outcomes() const noexcept {
    return outcomes_;
  }
  [[nodiscard]] const std::vector<std::string>& predictors() const noexcept {
    return predictors_;
  }
  [[nodiscard]] const std::vector<StepPtr>& steps() const noexcept { return steps_; }

  /// Apply the trained steps to the raw role columns of new data. Outcome
  /// columns are carried only when include_outcomes is set.
  [[nodiscard]] std::expected<data::Table, core::WorkflowError> bake(
      const data::Table& new_data, bool include_outcomes) const;

  bool operator==(const PreppedRecipe&) const = default;

 private:
  friend std::expected<PreppedRecipe, core::WorkflowError> prep(
      const Recipe& recipe, const data::Table& training);

  PreppedRecipe() = default;

  std::vector<std::string> outcomes_;
  std::vector<std::string> raw_predictors_;
  std::vector<std::string> predictors_;
  std::vector<StepPtr> steps_;
};

/// Train every step in order, each on the output of the previous one.
[[nodiscard]] std::expected<PreppedRecipe, core::WorkflowError> prep(
    const Recipe& recipe, const data::Table& training);

}  // namespace modelflow::preprocess
