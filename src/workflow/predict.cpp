#include <modelflow/workflow/predict.hpp>
#include <modelflow/preprocess/mold.hpp>
#include <modelflow/workflow/stages.hpp>

namespace modelflow::workflow {

std::expected<std::vector<double>, core::WorkflowError> predict(
    const Workflow& w, const data::Table& new_data) {
  if (!has_fit(w) || !has_mold(w) || !w.fit()->model) {
    return std::unexpected(core::WorkflowError::NotTrained);
  }
  auto predictors = preprocess::forge(*w.mold(), new_data);
  if (!predictors) {
    return std::unexpected(predictors.error());
  }
  return w.fit()->model->predict(*predictors);
}

}  // namespace modelflow::workflow
