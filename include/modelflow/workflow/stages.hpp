#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/workflow/workflow.hpp>
#include <expected>

namespace modelflow::workflow {

[[nodiscard]] bool has_preprocessor_formula(const Workflow& w) noexcept;
[[nodiscard]] bool has_preprocessor_recipe(const Workflow& w) noexcept;
[[nodiscard]] bool has_preprocessor(const Workflow& w) noexcept;
[[nodiscard]] bool has_spec(const Workflow& w) noexcept;
[[nodiscard]] bool has_mold(const Workflow& w) noexcept;
[[nodiscard]] bool has_fit(const Workflow& w) noexcept;

/// MissingPreprocessor unless a formula or recipe is present.
[[nodiscard]] std::expected<void, core::WorkflowError> validate_has_preprocessor(
    const Workflow& w);
/// MissingModel unless a model spec is present.
[[nodiscard]] std::expected<void, core::WorkflowError> validate_has_model(
    const Workflow& w);
/// MissingMold unless preprocessing has run.
[[nodiscard]] std::expected<void, core::WorkflowError> validate_has_mold(
    const Workflow& w);
/// Preprocessor, then model.
[[nodiscard]] std::expected<void, core::WorkflowError>
validate_has_minimal_components(const Workflow& w);

}  // namespace modelflow::workflow
