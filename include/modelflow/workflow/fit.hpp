#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <cstdint>
#include <expected>
#include <functional>

namespace modelflow::workflow {

enum class FitPhase : std::uint8_t {
  Preprocess,
  Model,
};

/// Callback for per-phase timing: (phase, duration_ms). Optional; pass to fit().
using PhaseTimingCallback = std::function<void(FitPhase phase, double duration_ms)>;

/// Preprocessing phase. Fails with MissingPreprocessor, then MissingData when
/// data is null or has no rows. Resolves the blueprint against the model (if
/// any), runs the preprocessor and returns a copy holding the mold; a default
/// blueprint stored in the action is replaced by the resolved one
/// (its base_blueprint is kept for the next resolution). The model
/// fit is not touched.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> fit_pre(
    const Workflow& w, const data::Table* data);

/// Model phase. Fails with MissingModel, then MissingMold. Fits the model spec on
/// the mold's predictors and outcomes and returns a copy holding the fit.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> fit_model(const Workflow& w);

/// Both phases. Checks that preprocessor and model are present before any
/// work, then fit_pre() and fit_model(); the first error is returned.
/// If timing_cb is non-null it is called after each phase.
[[nodiscard]] std::expected<Workflow, core::WorkflowError> fit(
    const Workflow& w,
    const data::Table* data,
    PhaseTimingCallback* timing_cb = nullptr);

[[nodiscard]] std::expected<Workflow, core::WorkflowError> fit(
    const Workflow& w,
    const data::Table& data,
    PhaseTimingCallback* timing_cb = nullptr);

}  // namespace modelflow::workflow
