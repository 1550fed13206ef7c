#include <modelflow/workflow/blueprint_resolver.hpp>
#include <modelflow/core/overloaded.hpp>

namespace modelflow::workflow {

preprocess::FormulaBlueprint resolve_formula_blueprint(const FormulaAction& action,
                                                       const model::ModelSpec* spec) {
  if (action.user_blueprint) {
    return action.blueprint;
  }
  preprocess::FormulaBlueprint out = action.base_blueprint;
  if (!spec) {
    return out;
  }
  if (const auto encoding = spec->required_encoding()) {
    out.indicators = encoding->indicators;
  }
  return out;
}

preprocess::Blueprint resolve_blueprint(const PreprocessorAction& action,
                                        const model::ModelSpec* spec) {
  return std::visit(
      core::Overloaded{
          [spec](const FormulaAction& a) -> preprocess::Blueprint {
            return resolve_formula_blueprint(a, spec);
          },
          [](const RecipeAction& a) -> preprocess::Blueprint { return a.blueprint; },
      },
      action);
}

}  // namespace modelflow::workflow
