#pragma once

#include <modelflow/workflow/workflow.hpp>

namespace modelflow::workflow::detail {

/// The only writer of Workflow state. Each setter keeps the downstream
/// invariants: a new preprocessor drops mold and fit, a new model drops the fit.
struct WorkflowAccess {
  static void set_preprocessor(Workflow& w, PreprocessorAction action) {
    w.pre_ = std::move(action);
    w.mold_.reset();
    w.fit_.reset();
  }

  static void set_model(Workflow& w, ModelAction action) {
    w.model_ = std::move(action);
    w.fit_.reset();
  }

  /// Records the resolved blueprint and the mold of a completed preprocessing phase.
  static void set_mold(Workflow& w, PreprocessorAction resolved, preprocess::Mold mold) {
    w.pre_ = std::move(resolved);
    w.mold_ = std::move(mold);
  }

  static void set_fit(Workflow& w, model::ModelFit fit) { w.fit_ = std::move(fit); }
};

}  // namespace modelflow::workflow::detail
