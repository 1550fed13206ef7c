#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/model/mode.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace modelflow::model {

/// Engine-specific trained model. Immutable once built.
class TrainedModel {
 public:
  virtual ~TrainedModel() = default;

  /// One numeric prediction per row of encoded predictors.
  [[nodiscard]] virtual std::expected<std::vector<double>, core::WorkflowError>
  predict(const data::Table& predictors) const = 0;
};

/// Result of fitting a model specification.
struct ModelFit {
  std::string engine;
  Mode mode{Mode::Unknown};
  std::shared_ptr<const TrainedModel> model;
  double elapsed_ms{0.0};

  /// Typed view of the trained model, or nullptr if it is another kind.
  template <class T>
  [[nodiscard]] const T* as() const noexcept {
    return dynamic_cast<const T*>(model.get());
  }
};

}  // namespace modelflow::model
