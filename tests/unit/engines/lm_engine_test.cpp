#include <modelflow/engines/lm_engine.hpp>
#include <modelflow/model/model_spec.hpp>
#include <test_data.hpp>
#include <gtest/gtest.h>
#include <memory>

namespace me = modelflow::engines;
namespace mm = modelflow::model;
namespace md = modelflow::data;
namespace mc = modelflow::core;
namespace mt = modelflow::test;

namespace {

md::Table column(const md::Table& t, const char* name) {
  auto s = t.select({name});
  EXPECT_TRUE(s.has_value());
  return *s;
}

}  // namespace

TEST(LmEngine, RequiresIndicatorsForRegression) {
  me::LmEngine lm;
  auto encoding = lm.required_encoding(mm::Mode::Regression);
  ASSERT_TRUE(encoding.has_value());
  EXPECT_TRUE(encoding->indicators);
}

TEST(LmEngine, MatchesClosedFormSimpleRegression) {
  const md::Table cars = mt::mtcars();
  me::LmEngine lm;
  auto fit = lm.fit(column(cars, "cyl"), column(cars, "mpg"), mm::Mode::Regression);
  ASSERT_TRUE(fit.has_value());
  EXPECT_EQ(fit->engine, "lm");

  const auto* model = fit->as<me::LinearModel>();
  ASSERT_NE(model, nullptr);
  ASSERT_EQ(model->coefficients().size(), 2u);
  EXPECT_EQ(model->coefficient_names()[0], "(Intercept)");
  EXPECT_EQ(model->coefficient_names()[1], "cyl");

  const auto expected = mt::simple_ols(cars.find("cyl")->numeric()->values,
                                       cars.find("mpg")->numeric()->values);
  EXPECT_NEAR(model->coefficients()[0], expected[0], 1e-8);
  EXPECT_NEAR(model->coefficients()[1], expected[1], 1e-8);
  EXPECT_NEAR(model->coefficients()[0], 37.88458, 1e-4);
  EXPECT_NEAR(model->coefficients()[1], -2.87579, 1e-4);
}

TEST(LmEngine, PredictUsesCoefficients) {
  me::LinearModel model({"(Intercept)", "x"}, {1.0, 2.0});
  md::Table x;
  ASSERT_TRUE(x.add_column(md::make_numeric("x", {0.0, 3.0})).has_value());
  auto pred = model.predict(x);
  ASSERT_TRUE(pred.has_value());
  ASSERT_EQ(pred->size(), 2u);
  EXPECT_DOUBLE_EQ((*pred)[0], 1.0);
  EXPECT_DOUBLE_EQ((*pred)[1], 7.0);
}

TEST(LmEngine, RejectsFactorPredictors) {
  const md::Table flowers = mt::iris();
  me::LmEngine lm;
  auto valid = lm.validate_input(column(flowers, "Species"), column(flowers, "Sepal.Length"),
                                 mm::Mode::Regression);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), mc::WorkflowError::UnsupportedEncoding);
}

TEST(LmEngine, RejectsTooFewRows) {
  md::Table x;
  md::Table y;
  ASSERT_TRUE(x.add_column(md::make_numeric("x", {1.0, 2.0})).has_value());
  ASSERT_TRUE(y.add_column(md::make_numeric("y", {1.0, 2.0})).has_value());
  me::LmEngine lm;
  auto valid = lm.validate_input(x, y, mm::Mode::Regression);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), mc::WorkflowError::InsufficientData);
}

TEST(LmEngine, RejectsEmptyDesign) {
  const md::Table cars = mt::mtcars();
  me::LmEngine lm;
  auto valid = lm.validate_input(md::Table{}, column(cars, "mpg"), mm::Mode::Regression);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), mc::WorkflowError::InvalidColumn);
}

TEST(LmEngine, RejectsNonNumericOutcome) {
  const md::Table flowers = mt::iris();
  auto spec = mm::linear_reg().set_engine(std::make_shared<const me::LmEngine>());
  auto fit = spec.fit(column(flowers, "Sepal.Length"), column(flowers, "Species"));
  ASSERT_FALSE(fit.has_value());
  EXPECT_EQ(fit.error(), mc::WorkflowError::InvalidColumn);
}
