#include "table_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace modelflow::engines::detail {

std::optional<cv::Mat> table_to_mat(const data::Table& table, bool add_intercept) {
  const int rows = static_cast<int>(table.rows());
  const int offset = add_intercept ? 1 : 0;
  const int cols = static_cast<int>(table.cols()) + offset;

  cv::Mat mat(rows, cols, CV_64F);
  if (add_intercept) {
    mat.col(0).setTo(cv::Scalar(1.0));
  }
  for (std::size_t j = 0; j < table.cols(); ++j) {
    const auto* numeric = table.column(j).numeric();
    if (!numeric) return std::nullopt;
    for (int i = 0; i < rows; ++i) {
      mat.at<double>(i, static_cast<int>(j) + offset) =
          numeric->values[static_cast<std::size_t>(i)];
    }
  }
  return mat;
}

std::vector<double> mat_to_vector(const cv::Mat& mat) {
  std::vector<double> out;
  out.reserve(static_cast<std::size_t>(mat.rows));
  for (int i = 0; i < mat.rows; ++i) {
    out.push_back(mat.at<double>(i, 0));
  }
  return out;
}

}  // namespace modelflow::engines::detail
