#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <expected>
#include <vector>

namespace modelflow::workflow {

/// Encode new_data with the training mold and predict with the model fit.
/// NotTrained unless the workflow has been fit.
[[nodiscard]] std::expected<std::vector<double>, core::WorkflowError> predict(
    const Workflow& w, const data::Table& new_data);

}  // namespace modelflow::workflow
