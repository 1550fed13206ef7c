#include <modelflow/data/table.hpp>
#include <algorithm>

namespace modelflow::data {

std::size_t Column::size() const noexcept {
  if (const auto* n = numeric()) return n->values.size();
  return factor()->codes.size();
}

Column make_numeric(std::string name, std::vector<double> values) {
  return Column{std::move(name), NumericColumn{std::move(values)}};
}

Column make_factor(std::string name, const std::vector<std::string>& labels) {
  FactorColumn f;
  f.levels = labels;
  std::sort(f.levels.begin(), f.levels.end());
  f.levels.erase(std::unique(f.levels.begin(), f.levels.end()), f.levels.end());
  f.codes.reserve(labels.size());
  for (const auto& label : labels) {
    const auto it = std::lower_bound(f.levels.begin(), f.levels.end(), label);
    f.codes.push_back(static_cast<std::int32_t>(it - f.levels.begin()));
  }
  return Column{std::move(name), std::move(f)};
}

std::expected<void, core::WorkflowError> Table::add_column(Column column) {
  if (column.name.empty() || find(column.name) != nullptr) {
    return std::unexpected(core::WorkflowError::InvalidColumn);
  }
  if (!columns_.empty() && column.size() != rows()) {
    return std::unexpected(core::WorkflowError::InvalidColumn);
  }
  columns_.push_back(std::move(column));
  return {};
}

std::size_t Table::rows() const noexcept {
  return columns_.empty() ? 0 : columns_.front().size();
}

const Column* Table::find(std::string_view name) const noexcept {
  for (const auto& c : columns_) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

std::vector<std::string> Table::names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_) out.push_back(c.name);
  return out;
}

std::expected<Table, core::WorkflowError> Table::select(
    const std::vector<std::string>& names) const {
  Table out;
  for (const auto& name : names) {
    const Column* c = find(name);
    if (!c) {
      return std::unexpected(core::WorkflowError::UnknownColumn);
    }
    auto added = out.add_column(*c);
    if (!added) {
      return std::unexpected(added.error());
    }
  }
  return out;
}

Table Table::prototype() const {
  Table out;
  for (const auto& c : columns_) {
    Column empty{c.name, c.data};
    if (auto* n = std::get_if<NumericColumn>(&empty.data)) {
      n->values.clear();
    } else {
      std::get<FactorColumn>(empty.data).codes.clear();
    }
    out.columns_.push_back(std::move(empty));
  }
  return out;
}

}  // namespace modelflow::data
