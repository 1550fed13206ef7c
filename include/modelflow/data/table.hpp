#pragma once

#include <modelflow/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace modelflow::data {

/// Memory: a Table owns its columns by value; copies are deep.
/// Thread-safety: distinct Table instances are independent.

struct NumericColumn {
  std::vector<double> values;

  bool operator==(const NumericColumn&) const = default;
};

/// Categorical column: sorted level set plus one code per row (-1 = not a level).
struct FactorColumn {
  std::vector<std::string> levels;
  std::vector<std::int32_t> codes;

  bool operator==(const FactorColumn&) const = default;
};

using ColumnData = std::variant<NumericColumn, FactorColumn>;

struct Column {
  std::string name;
  ColumnData data;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool is_factor() const noexcept {
    return std::holds_alternative<FactorColumn>(data);
  }
  [[nodiscard]] const NumericColumn* numeric() const noexcept {
    return std::get_if<NumericColumn>(&data);
  }
  [[nodiscard]] const FactorColumn* factor() const noexcept {
    return std::get_if<FactorColumn>(&data);
  }

  bool operator==(const Column&) const = default;
};

[[nodiscard]] Column make_numeric(std::string name, std::vector<double> values);

/// Factor from raw labels; levels are the sorted unique labels.
[[nodiscard]] Column make_factor(std::string name,
                                 const std::vector<std::string>& labels);

/// Tabular dataset with named columns of equal length.
class Table {
 public:
  Table() = default;

  /// Appends a column; fails with InvalidColumn on a duplicate name or length mismatch.
  [[nodiscard]] std::expected<void, core::WorkflowError> add_column(Column column);

  [[nodiscard]] std::size_t rows() const noexcept;
  [[nodiscard]] std::size_t cols() const noexcept { return columns_.size(); }

  /// True when there are no columns or no rows.
  [[nodiscard]] bool empty() const noexcept { return rows() == 0; }

  [[nodiscard]] const Column* find(std::string_view name) const noexcept;
  [[nodiscard]] const Column& column(std::size_t index) const {
    return columns_.at(index);
  }
  [[nodiscard]] const std::vector<Column>& columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] std::vector<std::string> names() const;

  /// New table with the named columns in the given order; UnknownColumn if one is missing.
  [[nodiscard]] std::expected<Table, core::WorkflowError> select(
      const std::vector<std::string>& names) const;

  /// Copy of the table with zero rows (factor levels kept).
  [[nodiscard]] Table prototype() const;

  bool operator==(const Table&) const = default;

 private:
  std::vector<Column> columns_;
};

}  // namespace modelflow::data
