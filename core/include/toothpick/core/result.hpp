#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace toothpick::core {

template <typename TValue>
struct OpResult {
  bool ok = false;
  TValue value{};
  std::string error{};
};

template <typename TValue>
OpResult<TValue> make_ok(TValue value) {
  OpResult<TValue> result{};
  result.ok = true;
  result.value = std::move(value);
  return result;
}

template <typename TValue>
OpResult<TValue> make_error(std::string message) {
  OpResult<TValue> result{};
  result.error = std::move(message);
  return result;
}

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

constexpr std::size_t kNoSegmentIndex = std::numeric_limits<std::size_t>::max();

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  std::size_t segment_index = kNoSegmentIndex;
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
  [[nodiscard]] bool has_code(const std::string& code) const;
};

}  // namespace toothpick::core
