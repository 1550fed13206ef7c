#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/model/model_fit.hpp>
#include <modelflow/model/model_spec.hpp>
#include <modelflow/preprocess/mold.hpp>
#include <modelflow/preprocess/recipe.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <expected>

namespace modelflow::workflow {

/// The formula or recipe; PreprocessorNotPresent if none was added.
[[nodiscard]] std::expected<Preprocessor, core::WorkflowError> pull_preprocessor(
    const Workflow& w);

/// The untrained model spec; SpecNotPresent if none was added.
[[nodiscard]] std::expected<model::ModelSpec, core::WorkflowError> pull_spec(
    const Workflow& w);

/// The model fit; FitNotPresent before fit().
[[nodiscard]] std::expected<model::ModelFit, core::WorkflowError> pull_fit(
    const Workflow& w);

/// The mold; MoldNotPresent before fit_pre().
[[nodiscard]] std::expected<preprocess::Mold, core::WorkflowError> pull_mold(
    const Workflow& w);

/// The trained recipe held by the mold. WrongPreprocessorKind unless the
/// preprocessor is a recipe, MoldNotPresent before fit_pre().
[[nodiscard]] std::expected<preprocess::PreppedRecipe, core::WorkflowError>
pull_prepped_recipe(const Workflow& w);

}  // namespace modelflow::workflow
