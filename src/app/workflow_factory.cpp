#include <modelflow/app/workflow_factory.hpp>
#include <modelflow/engines/lm_engine.hpp>
#include <modelflow/engines/mock_engine.hpp>
#include <memory>

namespace modelflow::app {

model::ModelSpec make_model_spec(const WorkflowConfig& cfg) {
  if (cfg.engine == EngineType::Lm) {
    return model::linear_reg().set_engine(std::make_shared<const engines::LmEngine>());
  }
  auto mock = std::make_shared<engines::MockEngine>();
  mock->set_encoding(model::EncodingInfo{.indicators = false});
  return model::rand_forest(cfg.mode).set_engine(std::move(mock));
}

workflow::FormulaAction make_formula_action(const WorkflowConfig& cfg,
                                            preprocess::Formula formula) {
  preprocess::FormulaBlueprint bp = preprocess::default_formula_blueprint();
  bp.intercept = cfg.intercept;
  if (cfg.indicators) {
    bp.indicators = *cfg.indicators;
  }
  return workflow::FormulaAction{std::move(formula), bp, cfg.indicators.has_value(), bp};
}

}  // namespace modelflow::app
