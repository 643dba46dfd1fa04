#include "toothpick/core/growth_state.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <limits>
#include <utility>
#include <vector>

#include "toothpick/core/endpoint_index.hpp"

namespace toothpick::core {

GrowthState initialize(double toothpick_length) {
  return GrowthState(toothpick_length);
}

GrowthState reset(double toothpick_length) {
  return initialize(toothpick_length);
}

GrowthState step(const GrowthState& state, StepStats* out_stats) {
  StepStats stats{};
  const EndpointIndex index = EndpointIndex::build(state.segments());

  // Candidates are staged here and committed only after the whole scan.
  SegmentStore new_segments{};
  EndpointSet working_used = state.used_endpoints_;

  for (const Segment& parent : state.segments()) {
    const auto [negative, positive] = parent.endpoints();
    for (const Vec2d& endpoint : std::array<Vec2d, 2>{negative, positive}) {
      ++stats.endpoints_scanned;
      if (working_used.contains(endpoint)) {
        ++stats.skipped_used;
        continue;
      }
      if (index.touching_count(endpoint) != 1) {
        ++stats.skipped_junction;
        continue;
      }

      const Segment candidate{endpoint, state.toothpick_length_, flipped(parent.orientation)};
      if (state.segments_.contains(candidate) || !new_segments.insert(candidate)) {
        ++stats.duplicates_suppressed;
        continue;
      }
      working_used.insert(endpoint);
      ++stats.spawned;
    }
  }

  GrowthState next = state;
  next.segments_.reserve(state.segment_count() + new_segments.size());
  for (const Segment& segment : new_segments.items()) {
    next.segments_.insert(segment);
  }
  next.used_endpoints_ = std::move(working_used);
  ++next.generation_;

  if (out_stats != nullptr) {
    *out_stats = stats;
  }
  return next;
}

Bounds2d bounds(const GrowthState& state) {
  if (state.segments().empty()) {
    return kEmptyStateBounds;
  }

  Bounds2d out{
      std::numeric_limits<double>::infinity(),
      -std::numeric_limits<double>::infinity(),
      std::numeric_limits<double>::infinity(),
      -std::numeric_limits<double>::infinity(),
  };
  for (const Segment& segment : state.segments()) {
    const auto [negative, positive] = segment.endpoints();
    for (const Vec2d& p : {negative, positive}) {
      out.min_x = std::min(out.min_x, p.x);
      out.max_x = std::max(out.max_x, p.x);
      out.min_y = std::min(out.min_y, p.y);
      out.max_y = std::max(out.max_y, p.y);
    }
  }
  return out;
}

}  // namespace toothpick::core
