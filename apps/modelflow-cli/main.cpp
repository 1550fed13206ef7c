/**
 * modelflow-cli: fit a formula workflow on a CSV file; print the mold and fit.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/modelflow-cli/modelflow_cli [--config path] --data file.csv --formula "y ~ x"
 */

#include <modelflow/app/config.hpp>
#include <modelflow/app/workflow_factory.hpp>
#include <modelflow/app/workflow_runner.hpp>
#include <modelflow/core/error.hpp>
#include <modelflow/data/csv_loader.hpp>
#include <modelflow/engines/lm_engine.hpp>
#include <modelflow/engines/mock_engine.hpp>
#include <modelflow/preprocess/formula.hpp>
#include <modelflow/workflow/actions.hpp>
#include <modelflow/workflow/pull.hpp>
#include <modelflow/workflow/workflow.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <variant>

namespace {

int fail(modelflow::core::WorkflowError error) {
  std::cerr << "Workflow error: " << modelflow::core::describe(error) << "\n";
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace modelflow;

  std::string config_path;
  std::string data_override;
  std::string formula_override;
  std::string engine_override;
  std::string indicators_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--data" && i + 1 < argc) {
      data_override = argv[++i];
    } else if (arg == "--formula" && i + 1 < argc) {
      formula_override = argv[++i];
    } else if (arg == "--engine" && i + 1 < argc) {
      engine_override = argv[++i];
    } else if (arg == "--indicators" && i + 1 < argc) {
      indicators_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: modelflow_cli [options]\n"
                << "  --config <path>       Workflow config (key=value file)\n"
                << "  --data <path>         CSV dataset with a header row\n"
                << "  --formula <text>      Model formula, e.g. \"mpg ~ cyl + disp\"\n"
                << "  --engine <type>       lm | mock (default from config: lm)\n"
                << "  --indicators <value>  auto | true | false (false keeps factors unexpanded)\n";
      return 0;
    }
  }

  app::WorkflowConfig cfg =
      config_path.empty() ? app::default_config() : app::load_config(config_path);

  if (!data_override.empty()) cfg.data_path = data_override;
  if (!formula_override.empty()) cfg.formula = formula_override;
  if (!engine_override.empty()) {
    if (engine_override == "lm") {
      cfg.engine = app::EngineType::Lm;
    } else if (engine_override == "mock") {
      cfg.engine = app::EngineType::Mock;
    } else {
      std::cerr << "Unknown --engine " << engine_override << " (use lm or mock)\n";
      return 1;
    }
  }
  if (!indicators_override.empty()) {
    auto parsed = app::parse_indicators(indicators_override);
    if (!parsed) {
      std::cerr << "Unknown --indicators " << indicators_override
                << " (use auto, true or false)\n";
      return 1;
    }
    cfg.indicators = *parsed;
  }

  if (cfg.data_path.empty() || cfg.formula.empty()) {
    std::cerr << "Both a dataset (--data) and a formula (--formula) are required\n";
    return 1;
  }

  auto table = data::load_csv(cfg.data_path, cfg.delimiter);
  if (!table) {
    std::cerr << "Failed to load dataset: " << cfg.data_path << "\n";
    return fail(table.error());
  }
  auto formula = preprocess::Formula::parse(cfg.formula);
  if (!formula) return fail(formula.error());

  auto wf = workflow::add_preprocessor(workflow::Workflow{},
                                      app::make_formula_action(cfg, *formula));
  if (!wf) return fail(wf.error());
  wf = workflow::add_model(*wf, app::make_model_spec(cfg));
  if (!wf) return fail(wf.error());

  app::PhaseTimingCallback timing_cb = [](workflow::FitPhase phase, double ms) {
    std::cerr << (phase == workflow::FitPhase::Preprocess ? "preprocess" : "model")
              << " phase: " << ms << " ms\n";
  };
  auto fitted = app::fit_workflow(*wf, *table, &timing_cb);
  if (!fitted) return fail(fitted.error());

  auto mold = workflow::pull_mold(*fitted);
  if (!mold) return fail(mold.error());
  auto fit = workflow::pull_fit(*fitted);
  if (!fit) return fail(fit.error());

  std::ostringstream out;
  const auto& bp = std::get<preprocess::FormulaBlueprint>(mold->blueprint);
  out << "rows=" << mold->predictors.rows() << " indicators=" << (bp.indicators ? "true" : "false")
      << " intercept=" << (bp.intercept ? "true" : "false") << "\n";
  out << "predictors:";
  for (const auto& name : mold->predictors.names()) out << " " << name;
  out << "\noutcomes:";
  for (const auto& name : mold->outcomes.names()) out << " " << name;
  out << "\nengine=" << fit->engine << " mode=" << model::to_string(fit->mode) << "\n";

  if (const auto* lm = fit->as<engines::LinearModel>()) {
    for (std::size_t i = 0; i < lm->coefficients().size(); ++i) {
      out << "  " << lm->coefficient_names()[i] << " = " << lm->coefficients()[i] << "\n";
    }
  } else if (const auto* mock = fit->as<engines::MockModel>()) {
    out << "  mean = " << mock->mean() << "\n";
  }
  std::cout << out.str();
  return 0;
}
