#include <modelflow/engines/lm_engine.hpp>
#include "table_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <memory>

namespace modelflow::engines {

using core::WorkflowError;

namespace {

constexpr const char* kInterceptName = "(Intercept)";

}  // namespace

std::optional<model::EncodingInfo> LmEngine::required_encoding(
    model::Mode mode) const {
  if (mode == model::Mode::Classification) return std::nullopt;
  return model::EncodingInfo{.indicators = true};
}

std::expected<void, WorkflowError> LmEngine::validate_input(
    const data::Table& predictors,
    const data::Table& outcomes,
    model::Mode mode) const {
  if (mode == model::Mode::Classification) {
    return std::unexpected(WorkflowError::EngineFailed);
  }
  if (outcomes.cols() != 1 || !outcomes.column(0).numeric() ||
      predictors.rows() != outcomes.rows()) {
    return std::unexpected(WorkflowError::InvalidColumn);
  }
  for (const auto& column : predictors.columns()) {
    if (column.is_factor()) {
      return std::unexpected(WorkflowError::UnsupportedEncoding);
    }
  }
  const bool has_intercept = predictors.find(kInterceptName) != nullptr;
  const std::size_t n_coef = predictors.cols() + (has_intercept ? 0 : 1);
  if (outcomes.rows() <= n_coef) {
    return std::unexpected(WorkflowError::InsufficientData);
  }
  return {};
}

std::expected<model::ModelFit, WorkflowError> LmEngine::fit(
    const data::Table& predictors,
    const data::Table& outcomes,
    model::Mode mode) const {
  // A blueprint with intercept = true already supplies the column of ones.
  const bool add_intercept = predictors.find(kInterceptName) == nullptr;
  auto x = detail::table_to_mat(predictors, add_intercept);
  auto y = detail::table_to_mat(outcomes, false);
  if (!x || !y) {
    return std::unexpected(WorkflowError::UnsupportedEncoding);
  }

  cv::Mat beta;
  if (!cv::solve(*x, *y, beta, cv::DECOMP_SVD)) {
    return std::unexpected(WorkflowError::EngineFailed);
  }

  std::vector<std::string> names;
  if (add_intercept) names.emplace_back(kInterceptName);
  for (const auto& n : predictors.names()) names.push_back(n);

  model::ModelFit out;
  out.engine = std::string(name());
  out.mode = mode == model::Mode::Unknown ? model::Mode::Regression : mode;
  out.model = std::make_shared<const LinearModel>(std::move(names),
                                                  detail::mat_to_vector(beta));
  return out;
}

std::expected<std::vector<double>, WorkflowError> LinearModel::predict(
    const data::Table& predictors) const {
  const bool add_intercept =
      !names_.empty() && names_.front() == kInterceptName &&
      predictors.find(kInterceptName) == nullptr;
  if (predictors.cols() + (add_intercept ? 1 : 0) != coefficients_.size()) {
    return std::unexpected(WorkflowError::InvalidColumn);
  }
  auto x = detail::table_to_mat(predictors, add_intercept);
  if (!x) {
    return std::unexpected(WorkflowError::UnsupportedEncoding);
  }
  const cv::Mat beta(static_cast<int>(coefficients_.size()), 1, CV_64F,
                     const_cast<double*>(coefficients_.data()));
  const cv::Mat fitted = (*x) * beta;
  return detail::mat_to_vector(fitted);
}

}  // namespace modelflow::engines
