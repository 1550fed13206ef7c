#include <modelflow/preprocess/formula.hpp>
#include <test_data.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace mp = modelflow::preprocess;
namespace mc = modelflow::core;

namespace {

std::vector<std::string> labels(const std::vector<mp::Term>& terms) {
  std::vector<std::string> out;
  for (const auto& t : terms) out.push_back(t.label());
  return out;
}

}  // namespace

TEST(Formula, ParsesOutcomeAndTerms) {
  auto f = mp::Formula::parse("mpg ~ cyl + log(disp)");
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->outcomes(), (std::vector<std::string>{"mpg"}));
  EXPECT_EQ(labels(f->terms()), (std::vector<std::string>{"cyl", "log(disp)"}));
  EXPECT_FALSE(f->has_dot());
  EXPECT_EQ(f->text(), "mpg ~ cyl + log(disp)");
}

TEST(Formula, DotExpandsToNonOutcomeColumns) {
  auto f = mp::Formula::parse("Sepal.Length ~ .");
  ASSERT_TRUE(f.has_value());
  EXPECT_TRUE(f->has_dot());
  auto terms = f->resolve_predictors(modelflow::test::iris());
  ASSERT_TRUE(terms.has_value());
  EXPECT_EQ(labels(*terms), (std::vector<std::string>{"Sepal.Width", "Petal.Length",
                                                      "Petal.Width", "Species"}));
}

TEST(Formula, RemovalAndBackticks) {
  auto f = mp::Formula::parse("`Sepal.Length` ~ . - Species - Petal.Width");
  ASSERT_TRUE(f.has_value());
  auto terms = f->resolve_predictors(modelflow::test::iris());
  ASSERT_TRUE(terms.has_value());
  EXPECT_EQ(labels(*terms), (std::vector<std::string>{"Sepal.Width", "Petal.Length"}));
}

TEST(Formula, InterceptMarkersIgnored) {
  auto f = mp::Formula::parse("mpg ~ cyl + 0");
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(labels(f->terms()), (std::vector<std::string>{"cyl"}));
}

TEST(Formula, MalformedTextRejected) {
  for (const char* text : {"mpg cyl", "mpg ~", "mpg ~ cyl +", "mpg ~ ~ cyl", "mpg ~ log(cyl",
                           ". ~ cyl", "mpg ~ cyl * disp"}) {
    auto f = mp::Formula::parse(text);
    ASSERT_FALSE(f.has_value()) << text;
    EXPECT_EQ(f.error(), mc::WorkflowError::InvalidFormula) << text;
  }
}

TEST(Formula, UnknownColumnReported) {
  auto f = mp::Formula::parse("mpg ~ hp");
  ASSERT_TRUE(f.has_value());
  auto terms = f->resolve_predictors(modelflow::test::mtcars());
  ASSERT_FALSE(terms.has_value());
  EXPECT_EQ(terms.error(), mc::WorkflowError::UnknownColumn);

  auto bad_outcome = mp::Formula::parse("hp ~ cyl");
  ASSERT_TRUE(bad_outcome.has_value());
  EXPECT_FALSE(bad_outcome->resolve_predictors(modelflow::test::mtcars()).has_value());
}
