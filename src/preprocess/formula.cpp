#include <modelflow/preprocess/formula.hpp>
#include <algorithm>
#include <cctype>

namespace modelflow::preprocess {

namespace {

using core::WorkflowError;

/// Tokenizer over one side of a formula.
class Lexer {
 public:
  explicit Lexer(std::string_view text) : text_(text) {}

  void skip_space() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  [[nodiscard]] bool done() {
    skip_space();
    return pos_ >= text_.size();
  }

  [[nodiscard]] char peek() {
    skip_space();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool consume(char ch) {
    if (peek() != ch) return false;
    ++pos_;
    return true;
  }

  /// Reads a bare or backtick-quoted name; empty on failure.
  std::string name() {
    skip_space();
    std::string out;
    if (pos_ < text_.size() && text_[pos_] == '`') {
      const auto close = text_.find('`', pos_ + 1);
      if (close == std::string_view::npos) return {};
      out.assign(text_.substr(pos_ + 1, close - pos_ - 1));
      pos_ = close + 1;
      return out;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '.' && ch != '_') {
        break;
      }
      out.push_back(ch);
      ++pos_;
    }
    return out;
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

bool is_intercept_marker(const std::string& name) {
  return name == "1" || name == "0";
}

std::expected<std::vector<std::string>, WorkflowError> parse_outcomes(
    std::string_view lhs) {
  std::vector<std::string> outcomes;
  Lexer lex(lhs);
  if (lex.done()) return outcomes;
  do {
    std::string n = lex.name();
    if (n.empty() || n == "." || is_intercept_marker(n)) {
      return std::unexpected(WorkflowError::InvalidFormula);
    }
    outcomes.push_back(std::move(n));
  } while (lex.consume('+'));
  if (!lex.done()) {
    return std::unexpected(WorkflowError::InvalidFormula);
  }
  return outcomes;
}

}  // namespace

std::string Term::label() const {
  if (transform == TermTransform::Log) return "log(" + column + ")";
  return column;
}

std::expected<Formula, WorkflowError> Formula::parse(std::string_view text) {
  const auto tilde = text.find('~');
  if (tilde == std::string_view::npos ||
      text.find('~', tilde + 1) != std::string_view::npos) {
    return std::unexpected(WorkflowError::InvalidFormula);
  }

  Formula f;
  f.text_.assign(text);

  auto outcomes = parse_outcomes(text.substr(0, tilde));
  if (!outcomes) {
    return std::unexpected(outcomes.error());
  }
  f.outcomes_ = std::move(*outcomes);

  Lexer lex(text.substr(tilde + 1));
  if (lex.done()) {
    return std::unexpected(WorkflowError::InvalidFormula);
  }
  bool negate = lex.consume('-');
  while (true) {
    std::string n = lex.name();
    Term term;
    if (n == "log" && lex.consume('(')) {
      term.transform = TermTransform::Log;
      n = lex.name();
      if (n.empty() || n == "." || !lex.consume(')')) {
        return std::unexpected(WorkflowError::InvalidFormula);
      }
    }
    if (n.empty()) {
      return std::unexpected(WorkflowError::InvalidFormula);
    }
    term.column = std::move(n);

    if (is_intercept_marker(term.column)) {
      // Intercept handling belongs to the blueprint.
    } else if (term.column == "." && term.transform == TermTransform::Identity) {
      if (negate) return std::unexpected(WorkflowError::InvalidFormula);
      f.has_dot_ = true;
    } else if (negate) {
      f.removed_.push_back(term.label());
    } else if (std::find(f.terms_.begin(), f.terms_.end(), term) == f.terms_.end()) {
      f.terms_.push_back(std::move(term));
    }

    if (lex.consume('+')) {
      negate = false;
    } else if (lex.consume('-')) {
      negate = true;
    } else {
      break;
    }
  }
  if (!lex.done()) {
    return std::unexpected(WorkflowError::InvalidFormula);
  }
  return f;
}

std::expected<std::vector<Term>, WorkflowError> Formula::resolve_predictors(
    const data::Table& data) const {
  for (const auto& outcome : outcomes_) {
    if (!data.find(outcome)) {
      return std::unexpected(WorkflowError::UnknownColumn);
    }
  }

  std::vector<Term> candidates = terms_;
  if (has_dot_) {
    for (const auto& column : data.columns()) {
      Term t{column.name, TermTransform::Identity};
      const bool is_outcome =
          std::find(outcomes_.begin(), outcomes_.end(), column.name) != outcomes_.end();
      if (!is_outcome &&
          std::find(candidates.begin(), candidates.end(), t) == candidates.end()) {
        candidates.push_back(std::move(t));
      }
    }
  }

  std::vector<Term> out;
  for (auto& term : candidates) {
    if (std::find(removed_.begin(), removed_.end(), term.label()) != removed_.end()) {
      continue;
    }
    if (!data.find(term.column)) {
      return std::unexpected(WorkflowError::UnknownColumn);
    }
    out.push_back(std::move(term));
  }
  return out;
}

}  // namespace modelflow::preprocess
