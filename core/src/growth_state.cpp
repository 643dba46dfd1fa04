#include "toothpick/core/growth_state.hpp"

#include <cmath>
#include <string>
#include <unordered_set>
#include <utility>

namespace toothpick::core {

namespace {

constexpr double kLengthMatchEps = 1e-9;

bool is_finite(const Vec2d& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

}  // namespace

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

bool ValidationResult::has_code(const std::string& code) const {
  for (const ValidationIssue& issue : issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

GrowthState::GrowthState(double toothpick_length) : toothpick_length_(toothpick_length) {
  segments_.insert(Segment{{0.0, 0.0}, toothpick_length, Orientation::kVertical});
}

OpResult<GrowthState> GrowthState::Restore(
    double toothpick_length,
    const std::vector<Segment>& segments,
    std::uint64_t generation,
    const std::vector<Vec2d>& used_endpoints) {
  if (!std::isfinite(toothpick_length) || toothpick_length <= 0.0) {
    return make_error<GrowthState>("toothpick_length must be positive and finite");
  }
  if (segments.empty()) {
    return make_error<GrowthState>("state requires at least one segment");
  }

  GrowthState state(toothpick_length);
  state.segments_.clear();
  state.segments_.reserve(segments.size());
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (!state.segments_.insert(segments[i])) {
      return make_error<GrowthState>("duplicate segment at index " + std::to_string(i));
    }
  }
  state.generation_ = generation;
  state.used_endpoints_.insert(used_endpoints.begin(), used_endpoints.end());
  return make_ok(std::move(state));
}

ValidationResult GrowthState::Validate() const {
  ValidationResult result;

  if (segments_.empty()) {
    result.issues.push_back({ValidationSeverity::kError, "StateEmpty", "State has no seed segment"});
  }
  if (!std::isfinite(toothpick_length_) || toothpick_length_ <= 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "LengthInvalid", "toothpick_length is not positive and finite"});
  }

  EndpointSet all_endpoints{};
  const std::vector<Segment>& items = segments_.items();
  for (std::size_t i = 0; i < items.size(); ++i) {
    const Segment& segment = items[i];
    if (!is_finite(segment.center) || !std::isfinite(segment.length)) {
      result.issues.push_back(
          {ValidationSeverity::kError, "SegmentNonFinite", "Segment has non-finite center or length", i});
    }
    if (std::abs(segment.length - toothpick_length_) > kLengthMatchEps) {
      result.issues.push_back({ValidationSeverity::kError, "SegmentLengthMismatch",
                               "Segment length differs from toothpick_length", i});
    }
    const auto found = segments_.index_of(segment);
    if (!found.has_value() || *found != i) {
      result.issues.push_back(
          {ValidationSeverity::kError, "SegmentIndexMismatch", "Segment lookup index is inconsistent", i});
    }
    const auto [negative, positive] = segment.endpoints();
    all_endpoints.insert(negative);
    all_endpoints.insert(positive);
  }

  std::unordered_set<Vec2d, Vec2dHash> child_centers{};
  for (const Segment& segment : items) {
    child_centers.insert(segment.center);
  }
  for (const Vec2d& used : used_endpoints_) {
    if (!all_endpoints.contains(used)) {
      result.issues.push_back({ValidationSeverity::kWarning, "UsedEndpointOrphan",
                               "Used endpoint is not an endpoint of any segment"});
    }
    if (!child_centers.contains(used)) {
      result.issues.push_back({ValidationSeverity::kError, "UsedEndpointWithoutChild",
                               "Used endpoint has no segment centered on it"});
    }
  }

  return result;
}

}  // namespace toothpick::core
