#include <modelflow/data/csv_loader.hpp>
#include <charconv>
#include <fstream>
#include <limits>
#include <string_view>
#include <vector>

namespace modelflow::data {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delimiter) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (const char ch : line) {
    if (ch == '"') {
      quoted = !quoted;
    } else if (ch == delimiter && !quoted) {
      trim(field);
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field.push_back(ch);
    }
  }
  trim(field);
  fields.push_back(std::move(field));
  return fields;
}

bool parse_double(std::string_view text, double& out) {
  if (text.empty()) {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (*first == '+') ++first;
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

std::expected<Table, core::WorkflowError> load_csv(const std::string& path,
                                                   char delimiter) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(core::WorkflowError::LoadFailed);
  }

  std::string line;
  if (!std::getline(f, line)) {
    return std::unexpected(core::WorkflowError::LoadFailed);
  }
  const std::vector<std::string> header = split(line, delimiter);

  std::vector<std::vector<std::string>> cells(header.size());
  while (std::getline(f, line)) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    auto fields = split(line, delimiter);
    if (fields.size() != header.size()) {
      return std::unexpected(core::WorkflowError::LoadFailed);
    }
    for (std::size_t i = 0; i < fields.size(); ++i) {
      cells[i].push_back(std::move(fields[i]));
    }
  }

  Table table;
  for (std::size_t i = 0; i < header.size(); ++i) {
    std::vector<double> values;
    values.reserve(cells[i].size());
    bool numeric = true;
    for (const auto& cell : cells[i]) {
      double v = 0.0;
      if (!parse_double(cell, v)) {
        numeric = false;
        break;
      }
      values.push_back(v);
    }
    Column column = numeric ? make_numeric(header[i], std::move(values))
                            : make_factor(header[i], cells[i]);
    auto added = table.add_column(std::move(column));
    if (!added) {
      return std::unexpected(core::WorkflowError::LoadFailed);
    }
  }
  return table;
}

}  // namespace modelflow::data
