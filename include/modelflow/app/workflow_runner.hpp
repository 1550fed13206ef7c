#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/workflow/fit.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace modelflow::app {

using FitResult = std::expected<workflow::Workflow, core::WorkflowError>;

/// Callback for each fitted workflow: (index into the input batch, result).
/// Must be thread-safe if using fit_workflow_batch_parallel.
using FitResultCallback = std::function<void(std::size_t index, const FitResult&)>;

/// Optional per-phase timing: (phase, duration_ms).
using PhaseTimingCallback = workflow::PhaseTimingCallback;

/// Fits one workflow. No threading; direct call.
[[nodiscard]] FitResult fit_workflow(const workflow::Workflow& w,
                                     const data::Table& data,
                                     PhaseTimingCallback* timing_cb = nullptr);

/// Fits several workflows on the same data sequentially; callback per workflow,
/// failures included.
void fit_workflow_batch(const std::vector<workflow::Workflow>& workflows,
                        const data::Table& data,
                        FitResultCallback callback);

/// Fits several workflows on a thread pool. Workflows share no mutable state,
/// so no locking is needed around fit(); callback may run on any worker.
/// num_workers 0 = use hardware concurrency.
void fit_workflow_batch_parallel(const std::vector<workflow::Workflow>& workflows,
                                 const data::Table& data,
                                 FitResultCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace modelflow::app
