#include <modelflow/workflow/stages.hpp>

namespace modelflow::workflow {

using core::WorkflowError;

bool has_preprocessor_formula(const Workflow& w) noexcept {
  return w.preprocessor() && std::holds_alternative<FormulaAction>(*w.preprocessor());
}

bool has_preprocessor_recipe(const Workflow& w) noexcept {
  return w.preprocessor() && std::holds_alternative<RecipeAction>(*w.preprocessor());
}

bool has_preprocessor(const Workflow& w) noexcept {
  return w.preprocessor().has_value();
}

bool has_spec(const Workflow& w) noexcept { return w.model().has_value(); }

bool has_mold(const Workflow& w) noexcept { return w.mold().has_value(); }

bool has_fit(const Workflow& w) noexcept { return w.fit().has_value(); }

std::expected<void, WorkflowError> validate_has_preprocessor(const Workflow& w) {
  if (!has_preprocessor(w)) {
    return std::unexpected(WorkflowError::MissingPreprocessor);
  }
  return {};
}

std::expected<void, WorkflowError> validate_has_model(const Workflow& w) {
  if (!has_spec(w)) {
    return std::unexpected(WorkflowError::MissingModel);
  }
  return {};
}

std::expected<void, WorkflowError> validate_has_mold(const Workflow& w) {
  if (!has_mold(w)) {
    return std::unexpected(WorkflowError::MissingMold);
  }
  return {};
}

std::expected<void, WorkflowError> validate_has_minimal_components(const Workflow& w) {
  auto pre = validate_has_preprocessor(w);
  if (!pre) return pre;
  return validate_has_model(w);
}

}  // namespace modelflow::workflow
