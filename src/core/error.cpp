#include <modelflow/core/error.hpp>

namespace modelflow::core {

std::string_view describe(WorkflowError error) noexcept {
  switch (error) {
    case WorkflowError::None:
      return "no error";
    case WorkflowError::DuplicatePreprocessor:
      return "The workflow already has a preprocessor of a different kind; "
             "pass DuplicatePolicy::Overwrite to replace it.";
    case WorkflowError::DuplicateModel:
      return "A `model` action has already been added to this workflow.";
    case WorkflowError::MissingPreprocessor:
      return "The workflow must have a formula or recipe preprocessor. "
             "Provide one with `add_formula()` or `add_recipe()`.";
    case WorkflowError::MissingModel:
      return "The workflow must have a model. Provide one with `add_model()`.";
    case WorkflowError::MissingData:
      return "`data` must be provided to fit a workflow.";
    case WorkflowError::MissingMold:
      return "The workflow must be preprocessed with `fit_pre()` before the "
             "model can be fit.";
    case WorkflowError::WrongPreprocessorKind:
      return "The workflow must have a recipe preprocessor.";
    case WorkflowError::PreprocessorNotPresent:
      return "The workflow does not have a preprocessor.";
    case WorkflowError::SpecNotPresent:
      return "The workflow does not have a model spec.";
    case WorkflowError::FitNotPresent:
      return "The workflow does not have a model fit. Have you called `fit()` yet?";
    case WorkflowError::MoldNotPresent:
      return "The workflow does not have a mold. Have you called `fit()` yet?";
    case WorkflowError::NotTrained:
      return "Can't predict on an untrained workflow.";
    case WorkflowError::LoadFailed:
      return "The dataset could not be loaded.";
    case WorkflowError::InvalidFormula:
      return "The formula could not be parsed.";
    case WorkflowError::UnknownColumn:
      return "A column referenced by the preprocessor is not in the data.";
    case WorkflowError::InvalidColumn:
      return "A column has the wrong type or length for this operation.";
    case WorkflowError::NovelLevel:
      return "New data contains a factor level not seen during training.";
    case WorkflowError::RecipeStepFailed:
      return "A recipe step failed.";
    case WorkflowError::EngineNotSet:
      return "The model specification has no engine.";
    case WorkflowError::UnsupportedEncoding:
      return "The engine cannot consume the encoded predictors.";
    case WorkflowError::InsufficientData:
      return "Not enough rows to fit the model.";
    case WorkflowError::EngineFailed:
      return "The model engine failed to fit.";
  }
  return "unknown error";
}

}  // namespace modelflow::core
