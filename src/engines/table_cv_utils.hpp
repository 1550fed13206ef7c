#pragma once

#include <modelflow/data/table.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>
#include <vector>

namespace modelflow::engines::detail {

/// Copy numeric columns into a rows x cols CV_64F matrix, optionally with a
/// leading column of ones. Returns nullopt if any column is a factor.
std::optional<cv::Mat> table_to_mat(const data::Table& table, bool add_intercept);

/// Flatten a single-column CV_64F matrix.
std::vector<double> mat_to_vector(const cv::Mat& mat);

}  // namespace modelflow::engines::detail
