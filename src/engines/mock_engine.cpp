#include <modelflow/engines/mock_engine.hpp>
#include <memory>
#include <numeric>

namespace modelflow::engines {

std::optional<model::EncodingInfo> MockEngine::required_encoding(
    model::Mode /*mode*/) const {
  return encoding_;
}

std::expected<model::ModelFit, core::WorkflowError> MockEngine::fit(
    const data::Table& predictors,
    const data::Table& outcomes,
    model::Mode mode) const {
  if (failure_) {
    return std::unexpected(*failure_);
  }

  double mean = 0.0;
  for (const auto& column : outcomes.columns()) {
    const auto* numeric = column.numeric();
    if (!numeric || numeric->values.empty()) continue;
    mean = std::accumulate(numeric->values.begin(), numeric->values.end(), 0.0) /
           static_cast<double>(numeric->values.size());
    break;
  }

  model::ModelFit out;
  out.engine = name_;
  out.mode = mode;
  out.model = std::make_shared<const MockModel>(predictors.names(), predictors.rows(), mean);
  return out;
}

std::expected<std::vector<double>, core::WorkflowError> MockModel::predict(
    const data::Table& predictors) const {
  if (predictors.names() != predictor_names_) {
    return std::unexpected(core::WorkflowError::InvalidColumn);
  }
  return std::vector<double>(predictors.rows(), mean_);
}

}  // namespace modelflow::engines
