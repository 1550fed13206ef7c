#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/model/model_spec.hpp>
#include <modelflow/preprocess/blueprint.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <modelflow/preprocess/recipe.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace modelflow::workflow {

/// What to do when the slot being filled is already occupied.
enum class DuplicatePolicy : std::uint8_t {
  /// Same kind replaces; a preprocessor of the other kind is an error.
  Replace,
  /// Any existing action is an error.
  Strict,
  /// Always replace.
  Overwrite,
};

/// Set the preprocessor. Clears any mold and model fit.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> add_preprocessor(
    const Workflow& w,
    PreprocessorAction action,
    DuplicatePolicy policy = DuplicatePolicy::Replace);

/// Formula preprocessor. Without a blueprint the default is used and may be
/// adjusted to the model's encoding preference at fit time.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> add_formula(
    const Workflow& w,
    preprocess::Formula formula,
    std::optional<preprocess::FormulaBlueprint> blueprint = std::nullopt,
    DuplicatePolicy policy = DuplicatePolicy::Replace);

[[nodiscard]] std::expected<Workflow, core::WorkflowError> add_recipe(
    const Workflow& w,
    preprocess::Recipe recipe,
    std::optional<preprocess::RecipeBlueprint> blueprint = std::nullopt,
    DuplicatePolicy policy = DuplicatePolicy::Replace);

/// Set the model. Clears the model fit; the mold survives.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> add_model(
    const Workflow& w,
    model::ModelSpec spec,
    DuplicatePolicy policy = DuplicatePolicy::Replace);

}  // namespace modelflow::workflow
