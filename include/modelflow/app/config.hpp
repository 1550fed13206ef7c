#pragma once

#include <modelflow/model/mode.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace modelflow::app {

/// Model engine selected by the config: mock (synthetic) or lm (least squares).
enum class EngineType {
  Mock,
  Lm,
};

/// Workflow configuration: dataset, formula, engine, encoding overrides.
struct WorkflowConfig {
  std::string data_path;
  std::string formula;
  EngineType engine{EngineType::Lm};
  model::Mode mode{model::Mode::Regression};
  char delimiter{','};
  /// Unset = let the engine decide; set = caller-supplied blueprint.
  std::optional<bool> indicators;
  bool intercept{false};
  std::size_t num_workers{0};
};

/// Load config from a simple key=value file (one per line) or use defaults.
WorkflowConfig load_config(const std::string& path);

/// Default config when no file is provided.
WorkflowConfig default_config();

/// Parses "auto" / "true" / "false" (also 1/0, yes/no). Anything else: nullopt.
std::optional<std::optional<bool>> parse_indicators(const std::string& value);

}  // namespace modelflow::app
