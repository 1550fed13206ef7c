#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace modelflow::model {

enum class Mode : std::uint8_t {
  Unknown,
  Regression,
  Classification,
};

[[nodiscard]] std::string_view to_string(Mode mode) noexcept;
[[nodiscard]] std::optional<Mode> parse_mode(std::string_view text) noexcept;

/// Predictor encoding an engine expects.
struct EncodingInfo {
  /// Factors must be expanded into indicator columns.
  bool indicators{true};

  bool operator==(const EncodingInfo&) const = default;
};

}  // namespace modelflow::model
