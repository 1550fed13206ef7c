#pragma once

#include <modelflow/model/model_engine.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace modelflow::engines {

/// Engine with a configurable encoding report and outcome (for tests/demo).
/// Configure before sharing it with a ModelSpec.
class MockEngine : public model::IModelEngine {
 public:
  explicit MockEngine(std::string name = "mock") : name_(std::move(name)) {}

  /// Encoding to report from required_encoding(); nullopt reports nothing.
  void set_encoding(std::optional<model::EncodingInfo> encoding) {
    encoding_ = encoding;
  }
  /// Make every fit() fail with this error.
  void set_failure(std::optional<core::WorkflowError> error) { failure_ = error; }

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }

  [[nodiscard]] std::optional<model::EncodingInfo> required_encoding(
      model::Mode mode) const override;

  [[nodiscard]] std::expected<model::ModelFit, core::WorkflowError> fit(
      const data::Table& predictors,
      const data::Table& outcomes,
      model::Mode mode) const override;

 private:
  std::string name_;
  std::optional<model::EncodingInfo> encoding_;
  std::optional<core::WorkflowError> failure_;
};

/// Records what it was trained on; predicts the training mean.
class MockModel : public model::TrainedModel {
 public:
  MockModel(std::vector<std::string> predictor_names, std::size_t rows, double mean)
      : predictor_names_(std::move(predictor_names)), rows_(rows), mean_(mean) {}

  [[nodiscard]] const std::vector<std::string>& predictor_names() const noexcept {
    return predictor_names_;
  }
  [[nodiscard]] std::size_t training_rows() const noexcept { return rows_; }
  [[nodiscard]] double mean() const noexcept { return mean_; }

  [[nodiscard]] std::expected<std::vector<double>, core::WorkflowError> predict(
      const data::Table& predictors) const override;

 private:
  std::vector<std::string> predictor_names_;
  std::size_t rows_;
  double mean_;
};

}  // namespace modelflow::engines
