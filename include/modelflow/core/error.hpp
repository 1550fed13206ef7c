#pragma once

#include <string_view>

namespace modelflow::core {

/// Workflow error codes; used with std::expected for recoverable failures.
enum class WorkflowError {
  None = 0,
  // Building a workflow.
  DuplicatePreprocessor,
  DuplicateModel,
  // Fit preconditions.
  MissingPreprocessor,
  MissingModel,
  MissingData,
  MissingMold,
  // Extractors.
  WrongPreprocessorKind,
  PreprocessorNotPresent,
  SpecNotPresent,
  FitNotPresent,
  MoldNotPresent,
  NotTrained,
  // Collaborators (data, preprocessing, engines).
  LoadFailed,
  InvalidFormula,
  UnknownColumn,
  InvalidColumn,
  NovelLevel,
  RecipeStepFailed,
  EngineNotSet,
  UnsupportedEncoding,
  InsufficientData,
  EngineFailed,
};

/// Human-readable message naming the missing or duplicated element.
[[nodiscard]] std::string_view describe(WorkflowError error) noexcept;

}  // namespace modelflow::core
