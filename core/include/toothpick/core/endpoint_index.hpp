#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "toothpick/core/segment.hpp"
#include "toothpick/core/types.hpp"

namespace toothpick::core {

// Per-step touching counts keyed by endpoint coordinate. Rebuilt from scratch, never updated.
class EndpointIndex {
 public:
  EndpointIndex() = default;

  [[nodiscard]] static EndpointIndex build(const std::vector<Segment>& segments);

  [[nodiscard]] std::size_t touching_count(const Vec2d& point) const;

  [[nodiscard]] std::size_t size() const { return counts_.size(); }

  [[nodiscard]] const std::unordered_map<Vec2d, std::size_t, Vec2dHash>& counts() const { return counts_; }

 private:
  std::unordered_map<Vec2d, std::size_t, Vec2dHash> counts_{};
};

[[nodiscard]] inline std::size_t touching_count(const EndpointIndex& index, const Vec2d& point) {
  return index.touching_count(point);
}

// Pairwise O(n) per query scan. Used as a reference when checking EndpointIndex.
[[nodiscard]] std::size_t touching_count_by_scan(const std::vector<Segment>& segments, const Vec2d& point);

}  // namespace toothpick::core
