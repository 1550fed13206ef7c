#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <expected>
#include <string>

namespace modelflow::data {

/// Load a delimited text file with a header row into a Table.
/// A column is numeric when every non-empty cell parses as a number (empty
/// cells become NaN); otherwise it is a factor. Missing file or a row with the
/// wrong number of fields returns LoadFailed.
[[nodiscard]] std::expected<Table, core::WorkflowError> load_csv(
    const std::string& path, char delimiter = ',');

}  // namespace modelflow::data
