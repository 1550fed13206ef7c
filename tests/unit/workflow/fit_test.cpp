#include <modelflow/engines/lm_engine.hpp>
#include <modelflow/engines/mock_engine.hpp>
#include <modelflow/workflow/fit.hpp>
#include <modelflow/workflow/stages.hpp>
#include <test_data.hpp>
#include <test_steps.hpp>
#include <test_workflows.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace mw = modelflow::workflow;
namespace mp = modelflow::preprocess;
namespace me = modelflow::engines;
namespace mc = modelflow::core;
namespace mt = modelflow::test;

TEST(Fit, RecipeWithLmMatchesLeastSquares) {
  const auto cars = mt::mtcars();
  auto w = mt::with_model(mt::with_recipe(mw::Workflow{}, mt::recipe("mpg ~ cyl", cars)),
                          mt::lm_spec());
  auto fitted = mw::fit(w, cars);
  ASSERT_TRUE(fitted.has_value());
  ASSERT_TRUE(fitted->trained());

  const auto* lm = fitted->fit()->as<me::LinearModel>();
  ASSERT_NE(lm, nullptr);
  const auto expected = mt::simple_ols(cars.find("cyl")->numeric()->values,
                                       cars.find("mpg")->numeric()->values);
  ASSERT_EQ(lm->coefficients().size(), 2u);
  EXPECT_NEAR(lm->coefficients()[0], expected[0], 1e-8);
  EXPECT_NEAR(lm->coefficients()[1], expected[1], 1e-8);
  EXPECT_EQ(fitted->fit()->engine, "lm");
}

TEST(Fit, WithoutDataFails) {
  auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  auto fitted = mw::fit(w, nullptr);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingData);
  EXPECT_NE(mc::describe(fitted.error()).find("must be provided"), std::string_view::npos);
}

TEST(Fit, EmptyDataFails) {
  auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  const modelflow::data::Table empty;
  auto fitted = mw::fit(w, empty);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingData);
}

TEST(Fit, ModelOnlyWorkflowFails) {
  const auto cars = mt::mtcars();
  auto fitted = mw::fit(mt::with_model(mw::Workflow{}, mt::lm_spec()), cars);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingPreprocessor);
  EXPECT_NE(mc::describe(fitted.error()).find("formula or recipe"), std::string_view::npos);
}

TEST(Fit, PreprocessorOnlyWorkflowFails) {
  const auto cars = mt::mtcars();
  auto fitted = mw::fit(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), cars);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingModel);
  EXPECT_NE(mc::describe(fitted.error()).find("must have a model"), std::string_view::npos);
}

TEST(Fit, ComponentsCheckedBeforeData) {
  auto fitted = mw::fit(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), nullptr);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingModel);
}

TEST(Fit, EngineWithoutIndicatorsKeepsFactor) {
  const auto flowers = mt::iris();
  auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "Sepal.Length ~ ."), mt::ranger_spec());
  auto fitted = mw::fit(w, flowers);
  ASSERT_TRUE(fitted.has_value());

  const auto& mold = *fitted->mold();
  const auto* species = mold.predictors.find("Species");
  ASSERT_NE(species, nullptr);
  EXPECT_TRUE(species->is_factor());
  EXPECT_EQ(mold.predictors.find("Speciessetosa"), nullptr);
  EXPECT_EQ(mold.predictors.cols(), 4u);

  ASSERT_TRUE(std::holds_alternative<mp::FormulaBlueprint>(mold.blueprint));
  EXPECT_FALSE(std::get<mp::FormulaBlueprint>(mold.blueprint).indicators);
  const auto& action = std::get<mw::FormulaAction>(*fitted->preprocessor());
  EXPECT_FALSE(action.blueprint.indicators);
  EXPECT_FALSE(action.user_blueprint);
}

TEST(Fit, UserBlueprintExpandsIndicators) {
  const auto flowers = mt::iris();
  mp::FormulaBlueprint user;
  user.indicators = true;
  auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "Sepal.Length ~ .", user),
                          mt::ranger_spec());
  auto fitted = mw::fit(w, flowers);
  ASSERT_TRUE(fitted.has_value());

  const auto& mold = *fitted->mold();
  EXPECT_EQ(mold.predictors.find("Species"), nullptr);
  EXPECT_NE(mold.predictors.find("Speciessetosa"), nullptr);
  EXPECT_NE(mold.predictors.find("Speciesvirginica"), nullptr);
  EXPECT_EQ(std::get<mp::FormulaBlueprint>(mold.blueprint), user);
  EXPECT_EQ(std::get<mw::FormulaAction>(*fitted->preprocessor()).blueprint, user);
}

TEST(Fit, RecipeBlueprintIgnoresEnginePreference) {
  const auto flowers = mt::iris();
  auto w = mt::with_model(
      mt::with_recipe(mw::Workflow{}, mt::recipe("Sepal.Length ~ .", flowers)),
      mt::ranger_spec());
  auto fitted = mw::fit(w, flowers);
  ASSERT_TRUE(fitted.has_value());
  const auto& mold = *fitted->mold();
  ASSERT_TRUE(std::holds_alternative<mp::RecipeBlueprint>(mold.blueprint));
  EXPECT_EQ(std::get<mp::RecipeBlueprint>(mold.blueprint), mp::default_recipe_blueprint());
  EXPECT_TRUE(mold.predictors.find("Species")->is_factor());
}

TEST(Fit, PreLeavesInputUntouched) {
  const auto cars = mt::mtcars();
  const auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  auto pre = mw::fit_pre(w, &cars);
  ASSERT_TRUE(pre.has_value());
  EXPECT_TRUE(mw::has_mold(*pre));
  EXPECT_FALSE(mw::has_fit(*pre));
  EXPECT_FALSE(mw::has_mold(w));
}

TEST(Fit, PreIsIdempotent) {
  const auto cars = mt::mtcars();
  const auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  auto once = mw::fit_pre(w, &cars);
  ASSERT_TRUE(once.has_value());
  auto twice = mw::fit_pre(*once, &cars);
  ASSERT_TRUE(twice.has_value());
  EXPECT_EQ(once->mold()->predictors, twice->mold()->predictors);
  EXPECT_EQ(once->mold()->outcomes, twice->mold()->outcomes);
  EXPECT_EQ(once->mold()->blueprint, twice->mold()->blueprint);
}

TEST(Fit, PreWithoutModelUsesDefaultBlueprint) {
  const auto flowers = mt::iris();
  auto pre = mw::fit_pre(mt::with_formula(mw::Workflow{}, "Sepal.Length ~ ."), &flowers);
  ASSERT_TRUE(pre.has_value());
  EXPECT_NE(pre->mold()->predictors.find("Speciessetosa"), nullptr);
}

TEST(Fit, PreFailsWithoutPreprocessor) {
  const auto cars = mt::mtcars();
  auto pre = mw::fit_pre(mw::Workflow{}, &cars);
  ASSERT_FALSE(pre.has_value());
  EXPECT_EQ(pre.error(), mc::WorkflowError::MissingPreprocessor);
}

TEST(Fit, ModelPhaseRequiresMold) {
  const auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  auto fitted = mw::fit_model(w);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::MissingMold);

  auto no_model = mw::fit_model(mw::Workflow{});
  ASSERT_FALSE(no_model.has_value());
  EXPECT_EQ(no_model.error(), mc::WorkflowError::MissingModel);
}

TEST(Fit, PreprocessorErrorPropagates) {
  const auto cars = mt::mtcars();
  auto w = mt::with_model(
      mt::with_recipe(mw::Workflow{},
                      mt::recipe("mpg ~ cyl", cars).add_step(std::make_shared<mt::FailingStep>())),
      mt::lm_spec());
  auto fitted = mw::fit(w, cars);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::RecipeStepFailed);
}

TEST(Fit, EngineErrorPropagates) {
  const auto cars = mt::mtcars();
  auto engine = std::make_shared<me::MockEngine>();
  engine->set_failure(mc::WorkflowError::EngineFailed);
  auto spec = modelflow::model::rand_forest(modelflow::model::Mode::Regression)
                  .set_engine(std::move(engine));
  auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), spec);
  auto fitted = mw::fit(w, cars);
  ASSERT_FALSE(fitted.has_value());
  EXPECT_EQ(fitted.error(), mc::WorkflowError::EngineFailed);
}

TEST(Fit, TimingCallbackSeesBothPhases) {
  const auto cars = mt::mtcars();
  const auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ cyl"), mt::lm_spec());
  std::vector<mw::FitPhase> phases;
  mw::PhaseTimingCallback cb = [&phases](mw::FitPhase phase, double ms) {
    EXPECT_GE(ms, 0.0);
    phases.push_back(phase);
  };
  auto fitted = mw::fit(w, cars, &cb);
  ASSERT_TRUE(fitted.has_value());
  ASSERT_EQ(phases.size(), 2u);
  EXPECT_EQ(phases[0], mw::FitPhase::Preprocess);
  EXPECT_EQ(phases[1], mw::FitPhase::Model);
}

TEST(Fit, RefitAfterEngineRemovedUsesDefaultBlueprint) {
  const auto flowers = mt::iris();
  const auto base = mt::with_formula(mw::Workflow{}, "Sepal.Length ~ .");
  auto first = mw::fit_pre(mt::with_model(base, mt::ranger_spec()), &flowers);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->mold()->predictors.find("Species")->is_factor());

  const auto no_engine = modelflow::model::rand_forest(modelflow::model::Mode::Regression);
  auto refit = mw::fit_pre(mt::with_model(*first, no_engine), &flowers);
  ASSERT_TRUE(refit.has_value());
  auto fresh = mw::fit_pre(mt::with_model(base, no_engine), &flowers);
  ASSERT_TRUE(fresh.has_value());

  const auto& mold = *refit->mold();
  EXPECT_EQ(mold.predictors.find("Species"), nullptr);
  EXPECT_NE(mold.predictors.find("Speciessetosa"), nullptr);
  EXPECT_EQ(mold.blueprint, mp::Blueprint{mp::default_formula_blueprint()});
  EXPECT_EQ(mold.predictors, fresh->mold()->predictors);
  EXPECT_EQ(mold.blueprint, fresh->mold()->blueprint);
}

TEST(Fit, ModelSwapKeepsMoldUntilRefit) {
  const auto flowers = mt::iris();
  const auto w = mt::with_model(mt::with_formula(mw::Workflow{}, "Sepal.Length ~ ."),
                                mt::ranger_spec());
  auto pre = mw::fit_pre(w, &flowers);
  ASSERT_TRUE(pre.has_value());

  const auto swapped = mt::with_model(*pre, mt::lm_spec());
  ASSERT_TRUE(mw::has_mold(swapped));
  EXPECT_EQ(swapped.mold()->predictors, pre->mold()->predictors);

  auto stale = mw::fit_model(swapped);
  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error(), mc::WorkflowError::UnsupportedEncoding);

  auto refit = mw::fit_pre(swapped, &flowers);
  ASSERT_TRUE(refit.has_value());
  EXPECT_NE(refit->mold()->predictors.find("Speciessetosa"), nullptr);
  EXPECT_TRUE(std::get<mp::FormulaBlueprint>(refit->mold()->blueprint).indicators);
}

TEST(Fit, InterceptOnlyFormulaWithoutInterceptColumnFails) {
  const auto cars = mt::mtcars();
  for (const char* text : {"mpg ~ 1", "mpg ~ . - cyl - disp"}) {
    auto fitted = mw::fit(mt::with_model(mt::with_formula(mw::Workflow{}, text), mt::lm_spec()),
                          cars);
    ASSERT_FALSE(fitted.has_value()) << text;
    EXPECT_EQ(fitted.error(), mc::WorkflowError::InvalidColumn) << text;
  }
}

TEST(Fit, InterceptOnlyFormulaWithInterceptBlueprint) {
  const auto cars = mt::mtcars();
  mp::FormulaBlueprint bp;
  bp.intercept = true;
  auto fitted = mw::fit(
      mt::with_model(mt::with_formula(mw::Workflow{}, "mpg ~ 1", bp), mt::lm_spec()), cars);
  ASSERT_TRUE(fitted.has_value());
  const auto* lm = fitted->fit()->as<me::LinearModel>();
  ASSERT_NE(lm, nullptr);
  ASSERT_EQ(lm->coefficients().size(), 1u);
  EXPECT_NEAR(lm->coefficients()[0], 20.090625, 1e-9);
}
