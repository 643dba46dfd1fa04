#include "toothpick/core/endpoint_index.hpp"

namespace toothpick::core {

EndpointIndex EndpointIndex::build(const std::vector<Segment>& segments) {
  EndpointIndex index;
  index.counts_.reserve(segments.size() * 2);
  for (const Segment& segment : segments) {
    const auto [negative, positive] = segment.endpoints();
    ++index.counts_[negative];
    ++index.counts_[positive];
  }
  return index;
}

std::size_t EndpointIndex::touching_count(const Vec2d& point) const {
  auto it = counts_.find(point);
  if (it == counts_.end()) {
    return 0;
  }
  return it->second;
}

std::size_t touching_count_by_scan(const std::vector<Segment>& segments, const Vec2d& point) {
  std::size_t count = 0;
  for (const Segment& other : segments) {
    const auto [negative, positive] = other.endpoints();
    if (negative == point || positive == point) {
      ++count;
    }
  }
  return count;
}

}  // namespace toothpick::core
