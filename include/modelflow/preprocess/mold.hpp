#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/preprocess/blueprint.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <modelflow/preprocess/recipe.hpp>
#include <expected>
#include <optional>
#include <vector>

namespace modelflow::preprocess {

/// Output of running a preprocessor on training data.
struct Mold {
  data::Table predictors;
  data::Table outcomes;
  /// Blueprint actually used to encode the predictors.
  Blueprint blueprint;
  /// Raw predictor columns as seen at fit time, zero rows. Factor levels here
  /// drive the encoding of new data.
  data::Table ptype;
  /// Resolved right-hand-side terms (formula preprocessors).
  std::vector<Term> terms;
  /// Trained recipe (recipe preprocessors).
  std::optional<PreppedRecipe> recipe;
};

/// Formula preprocessing: select outcomes, encode terms per blueprint.
[[nodiscard]] std::expected<Mold, core::WorkflowError> mold_formula(
    const Formula& formula,
    const FormulaBlueprint& blueprint,
    const data::Table& data);

/// Recipe preprocessing: prep the recipe on data, bake it, split roles.
/// Factors are left as they are; the recipe owns its encoding.
[[nodiscard]] std::expected<Mold, core::WorkflowError> mold_recipe(
    const Recipe& recipe,
    const RecipeBlueprint& blueprint,
    const data::Table& data);

/// Encode predictors of new data exactly as the training data was encoded.
[[nodiscard]] std::expected<data::Table, core::WorkflowError> forge(
    const Mold& mold, const data::Table& new_data);

}  // namespace modelflow::preprocess
