#include <modelflow/workflow/fit.hpp>
#include <modelflow/core/overloaded.hpp>
#include <modelflow/preprocess/mold.hpp>
#include <modelflow/workflow/blueprint_resolver.hpp>
#include <modelflow/workflow/stages.hpp>
#include "workflow_access.hpp"
#include <chrono>

namespace modelflow::workflow {

using core::WorkflowError;

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

}  // namespace

std::expected<Workflow, WorkflowError> fit_pre(const Workflow& w,
                                               const data::Table* data) {
  auto valid = validate_has_preprocessor(w);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (!data || data->empty()) {
    return std::unexpected(WorkflowError::MissingData);
  }

  const model::ModelSpec* spec = w.model() ? &w.model()->spec : nullptr;
  PreprocessorAction resolved = *w.preprocessor();

  auto mold = std::visit(
      core::Overloaded{
          [&](FormulaAction& a) -> std::expected<preprocess::Mold, WorkflowError> {
            a.blueprint = resolve_formula_blueprint(a, spec);
            return preprocess::mold_formula(a.formula, a.blueprint, *data);
          },
          [&](RecipeAction& a) -> std::expected<preprocess::Mold, WorkflowError> {
            return preprocess::mold_recipe(a.recipe, a.blueprint, *data);
          },
      },
      resolved);
  if (!mold) {
    return std::unexpected(mold.error());
  }

  Workflow out = w;
  detail::WorkflowAccess::set_mold(out, std::move(resolved), std::move(*mold));
  return out;
}

std::expected<Workflow, WorkflowError> fit_model(const Workflow& w) {
  auto valid = validate_has_model(w);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  valid = validate_has_mold(w);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const preprocess::Mold& mold = *w.mold();
  auto result = w.model()->spec.fit(mold.predictors, mold.outcomes);
  if (!result) {
    return std::unexpected(result.error());
  }

  Workflow out = w;
  detail::WorkflowAccess::set_fit(out, std::move(*result));
  return out;
}

std::expected<Workflow, WorkflowError> fit(const Workflow& w,
                                           const data::Table* data,
                                           PhaseTimingCallback* timing_cb) {
  auto valid = validate_has_minimal_components(w);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto start = std::chrono::steady_clock::now();
  auto pre = fit_pre(w, data);
  if (!pre) {
    return pre;
  }
  if (timing_cb) (*timing_cb)(FitPhase::Preprocess, elapsed_ms(start));

  start = std::chrono::steady_clock::now();
  auto fitted = fit_model(*pre);
  if (fitted && timing_cb) (*timing_cb)(FitPhase::Model, elapsed_ms(start));
  return fitted;
}

std::expected<Workflow, WorkflowError> fit(const Workflow& w,
                                           const data::Table& data,
                                           PhaseTimingCallback* timing_cb) {
  return fit(w, &data, timing_cb);
}

}  // namespace modelflow::workflow
