#pragma once

#include <modelflow/core/error.hpp>
#include <modelflow/data/table.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace modelflow::preprocess {

enum class TermTransform : std::uint8_t {
  Identity,
  Log,
};

/// One right-hand-side term: a column, optionally transformed.
struct Term {
  std::string column;
  TermTransform transform{TermTransform::Identity};

  /// Name of the encoded column, e.g. "disp" or "log(disp)".
  [[nodiscard]] std::string label() const;

  bool operator==(const Term&) const = default;
};

/// Model formula "outcomes ~ terms".
/// Supported on the right: names (letters, digits, '.', '_', or `quoted`),
/// '.', '-name', 'log(name)', and the intercept markers '1' / '0', which are
/// accepted and ignored (the blueprint decides the intercept).
class Formula {
 public:
  [[nodiscard]] static std::expected<Formula, core::WorkflowError> parse(
      std::string_view text);

  [[nodiscard]] const std::string& text() const noexcept { return text_; }
  [[nodiscard]] const std::vector<std::string>& outcomes() const noexcept {
    return outcomes_;
  }
  [[nodiscard]] const std::vector<Term>& terms() const noexcept { return terms_; }
  [[nodiscard]] const std::vector<std::string>& removed() const noexcept {
    return removed_;
  }
  [[nodiscard]] bool has_dot() const noexcept { return has_dot_; }

  /// Expands '.' to every column not used as an outcome, drops removed
  /// columns, and checks that each remaining term exists in data.
  [[nodiscard]] std::expected<std::vector<Term>, core::WorkflowError>
  resolve_predictors(const data::Table& data) const;

  bool operator==(const Formula&) const = default;

 private:
  Formula() = default;

  std::string text_;
  std::vector<std::string> outcomes_;
  std::vector<Term> terms_;
  std::vector<std::string> removed_;
  bool has_dot_{false};
};

}  // namespace modelflow::preprocess
