#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

#include "toothpick/core/result.hpp"
#include "toothpick/core/segment.hpp"
#include "toothpick/core/types.hpp"
#include "toothpick/core/value_store.hpp"

namespace toothpick::core {

using EndpointSet = std::unordered_set<Vec2d, Vec2dHash>;

constexpr double kDefaultToothpickLength = 10.0;

// Fallback returned by bounds() for a state without segments.
constexpr Bounds2d kEmptyStateBounds{-100.0, 100.0, -100.0, 100.0};

struct StepStats {
  std::size_t endpoints_scanned = 0;
  std::size_t skipped_used = 0;
  std::size_t skipped_junction = 0;
  std::size_t duplicates_suppressed = 0;
  std::size_t spawned = 0;

  [[nodiscard]] std::size_t eligible() const { return spawned + duplicates_suppressed; }
};

// Snapshot of the simulation at a generation boundary. Only step() produces successors.
class GrowthState {
 public:
  // Seed state: one vertical toothpick centered at the origin.
  explicit GrowthState(double toothpick_length = kDefaultToothpickLength);

  // Rebuilds a state from its parts. Rejects empty or duplicated segment lists.
  [[nodiscard]] static OpResult<GrowthState> Restore(
      double toothpick_length,
      const std::vector<Segment>& segments,
      std::uint64_t generation,
      const std::vector<Vec2d>& used_endpoints);

  [[nodiscard]] double toothpick_length() const { return toothpick_length_; }
  [[nodiscard]] const std::vector<Segment>& segments() const { return segments_.items(); }
  [[nodiscard]] const SegmentStore& segment_store() const { return segments_; }
  [[nodiscard]] std::uint64_t generation() const { return generation_; }
  [[nodiscard]] const EndpointSet& used_endpoints() const { return used_endpoints_; }
  [[nodiscard]] std::size_t segment_count() const { return segments_.size(); }
  [[nodiscard]] bool contains(const Segment& segment) const { return segments_.contains(segment); }
  [[nodiscard]] bool is_used(const Vec2d& endpoint) const { return used_endpoints_.contains(endpoint); }

  [[nodiscard]] ValidationResult Validate() const;

 private:
  friend GrowthState step(const GrowthState& state, StepStats* out_stats);

  double toothpick_length_ = 0.0;
  SegmentStore segments_{};
  std::uint64_t generation_ = 0;
  EndpointSet used_endpoints_{};
};

[[nodiscard]] GrowthState initialize(double toothpick_length);
[[nodiscard]] GrowthState reset(double toothpick_length);

// Advances exactly one generation. The input state is not modified.
[[nodiscard]] GrowthState step(const GrowthState& state, StepStats* out_stats = nullptr);

[[nodiscard]] Bounds2d bounds(const GrowthState& state);

[[nodiscard]] inline std::size_t segment_count(const GrowthState& state) {
  return state.segment_count();
}

[[nodiscard]] inline std::uint64_t generation(const GrowthState& state) {
  return state.generation();
}

}  // namespace toothpick::core
