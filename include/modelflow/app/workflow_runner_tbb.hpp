#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#ifdef MODELFLOW_HAS_TBB

namespace modelflow::app {

/// Callback for each result of the TBB runner; receives the result and the
/// work item's id. May be invoked from TBB worker threads; must be thread-safe.
using FitResultCallbackWithId = std::function<void(
    const std::expected<workflow::Workflow, core::WorkflowError>&, const std::string& id)>;

/// Fits a batch of (id, workflow) items in parallel using TBB.
///
/// Every item is fit against the same data; data is read only. Workflows are
/// values, so the same workflow may appear under several ids. The callback
/// receives failures as well as fitted workflows.
///
/// \param work_items Flat list of (id, workflow) pairs, e.g. one per candidate model.
/// \param data Training data shared by all items.
/// \param callback Invoked once per item with (result, id). Must be thread-safe.
void fit_workflows_tbb(
    const std::vector<std::pair<std::string, workflow::Workflow>>& work_items,
    const data::Table& data,
    FitResultCallbackWithId callback);

}  // namespace modelflow::app

#endif  // MODELFLOW_HAS_TBB
