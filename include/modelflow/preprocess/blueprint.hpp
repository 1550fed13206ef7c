#pragma once

#include <variant>

namespace modelflow::preprocess {

/// How a formula preprocessor encodes raw columns into the design matrix.
struct FormulaBlueprint {
  bool intercept{false};
  /// Expand factor predictors into 0/1 indicator columns.
  bool indicators{true};
  bool allow_novel_levels{false};

  bool operator==(const FormulaBlueprint&) const = default;
};

/// Recipes define their own encoding; the blueprint only governs new data.
struct RecipeBlueprint {
  bool allow_novel_levels{false};

  bool operator==(const RecipeBlueprint&) const = default;
};

using Blueprint = std::variant<FormulaBlueprint, RecipeBlueprint>;

[[nodiscard]] inline FormulaBlueprint default_formula_blueprint() { return {}; }
[[nodiscard]] inline RecipeBlueprint default_recipe_blueprint() { return {}; }

}  // namespace modelflow::preprocess
