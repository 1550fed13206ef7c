#pragma once

#include <modelflow/model/model_engine.hpp>
#include <string>
#include <vector>

namespace modelflow::engines {

/// Ordinary least squares with intercept, solved by OpenCV (SVD).
/// Needs indicator-encoded (all numeric) predictors and one numeric outcome.
class LmEngine : public model::IModelEngine {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "lm"; }

  [[nodiscard]] std::optional<model::EncodingInfo> required_encoding(
      model::Mode mode) const override;

  [[nodiscard]] std::expected<void, core::WorkflowError> validate_input(
      const data::Table& predictors,
      const data::Table& outcomes,
      model::Mode mode) const override;

  [[nodiscard]] std::expected<model::ModelFit, core::WorkflowError> fit(
      const data::Table& predictors,
      const data::Table& outcomes,
      model::Mode mode) const override;
};

/// Trained linear model; coefficient 0 is the intercept.
class LinearModel : public model::TrainedModel {
 public:
  LinearModel(std::vector<std::string> names, std::vector<double> coefficients)
      : names_(std::move(names)), coefficients_(std::move(coefficients)) {}

  [[nodiscard]] const std::vector<std::string>& coefficient_names() const noexcept {
    return names_;
  }
  [[nodiscard]] const std::vector<double>& coefficients() const noexcept {
    return coefficients_;
  }

  [[nodiscard]] std::expected<std::vector<double>, core::WorkflowError> predict(
      const data::Table& predictors) const override;

 private:
  std::vector<std::string> names_;
  std::vector<double> coefficients_;
};

}  // namespace modelflow::engines
