#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <modelflow/model/mode.hpp>
#include <modelflow/model/model_fit.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace modelflow::model {

/// Abstract model engine: encoded predictors + outcomes -> ModelFit.
/// Implement name() and fit(); optionally override required_encoding and
/// validate_input. Engines are const after construction and may be shared.
class IModelEngine {
 public:
  virtual ~IModelEngine() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Encoding preference for this mode. Default: not reported.
  [[nodiscard]] virtual std::optional<EncodingInfo> required_encoding(
      Mode /*mode*/) const {
    return std::nullopt;
  }

  /// Optional: check shape and column types before fit. Default: accept.
  [[nodiscard]] virtual std::expected<void, core::WorkflowError> validate_input(
      const data::Table& /*predictors*/,
      const data::Table& /*outcomes*/,
      Mode /*mode*/) const {
    return {};
  }

  [[nodiscard]] virtual std::expected<ModelFit, core::WorkflowError> fit(
      const data::Table& predictors,
      const data::Table& outcomes,
      Mode mode) const = 0;
};

}  // namespace modelflow::model
