#pragma once

#include <modelflow/model/model_fit.hpp>
#include <modelflow/model/model_spec.hpp>
#include <modelflow/preprocess/blueprint.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <modelflow/preprocess/mold.hpp>
#include <modelflow/preprocess/recipe.hpp>
#include <optional>
#include <string>
#include <variant>

namespace modelflow::workflow {

/// Formula preprocessor. user_blueprint marks a blueprint the caller supplied;
/// only default blueprints are adjusted to the model's encoding preference.
/// After fit_pre(), blueprint holds the resolved blueprint; resolution always
/// starts again from base_blueprint.
struct FormulaAction {
  preprocess::Formula formula;
  preprocess::FormulaBlueprint blueprint;
  bool user_blueprint{false};
  preprocess::FormulaBlueprint base_blueprint{preprocess::default_formula_blueprint()};
};

struct RecipeAction {
  preprocess::Recipe recipe;
  preprocess::RecipeBlueprint blueprint;
  bool user_blueprint{false};
};

using PreprocessorAction = std::variant<FormulaAction, RecipeAction>;

/// What pull_preprocessor() hands back.
using Preprocessor = std::variant<preprocess::Formula, preprocess::Recipe>;

struct ModelAction {
  model::ModelSpec spec;
  std::string name{"model"};
};

namespace detail {
struct WorkflowAccess;
}  // namespace detail

/// Staged pipeline: zero or one preprocessor, zero or one model, and after
/// fitting the mold and the model fit. Immutable value; the functions in
/// actions.hpp and fit.hpp return updated copies.
/// Thread-safety: distinct Workflow values are independent; copies share only
/// immutable trained objects.
class Workflow {
 public:
  Workflow() = default;

  [[nodiscard]] const std::optional<PreprocessorAction>& preprocessor() const noexcept {
    return pre_;
  }
  [[nodiscard]] const std::optional<ModelAction>& model() const noexcept {
    return model_;
  }
  [[nodiscard]] const std::optional<preprocess::Mold>& mold() const noexcept {
    return mold_;
  }
  [[nodiscard]] const std::optional<model::ModelFit>& fit() const noexcept {
    return fit_;
  }

  [[nodiscard]] bool trained() const noexcept { return fit_.has_value(); }

 private:
  friend struct detail::WorkflowAccess;

  std::optional<PreprocessorAction> pre_;
  std::optional<ModelAction> model_;
  std::optional<preprocess::Mold> mold_;
  std::optional<model::ModelFit> fit_;
};

}  // namespace modelflow::workflow
