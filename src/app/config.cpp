#include <modelflow/app/config.hpp>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace modelflow::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::optional<bool> parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return std::nullopt;
}

}  // namespace

std::optional<std::optional<bool>> parse_indicators(const std::string& value) {
  if (value == "auto") return std::optional<bool>{};
  if (auto b = parse_bool(value)) return std::optional<bool>{*b};
  return std::nullopt;
}

WorkflowConfig default_config() {
  WorkflowConfig c;
  c.data_path = "";
  c.formula = "";
  c.engine = EngineType::Lm;
  c.mode = model::Mode::Regression;
  c.delimiter = ',';
  c.indicators = std::nullopt;
  c.intercept = false;
  c.num_workers = 0;
  return c;
}

WorkflowConfig load_config(const std::string& path) {
  WorkflowConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "data_path") c.data_path = value;
    else if (key == "formula") c.formula = value;
    else if (key == "engine") {
      if (value == "lm") c.engine = EngineType::Lm;
      else if (value == "mock") c.engine = EngineType::Mock;
    }
    else if (key == "mode") {
      if (auto m = model::parse_mode(value)) c.mode = *m;
    }
    else if (key == "delimiter") {
      if (value == "\\t" || value == "tab") c.delimiter = '\t';
      else if (value.size() == 1) c.delimiter = value[0];
    }
    else if (key == "indicators") {
      if (auto i = parse_indicators(value)) c.indicators = *i;
    }
    else if (key == "intercept") {
      if (auto b = parse_bool(value)) c.intercept = *b;
    }
    else if (key == "num_workers") {
      std::size_t n = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec == std::errc{} && ptr == value.data() + value.size()) c.num_workers = n;
    }
  }
  return c;
}

}  // namespace modelflow::app
