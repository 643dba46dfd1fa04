#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "toothpick/core/types.hpp"

namespace toothpick::core {

enum class Orientation : std::uint8_t {
  kHorizontal = 0,
  kVertical = 1,
};

inline Orientation flipped(Orientation orientation) {
  return orientation == Orientation::kHorizontal ? Orientation::kVertical : Orientation::kHorizontal;
}

// One toothpick. Identity is (center, orientation); length is carried for geometry only.
struct Segment {
  Vec2d center{};
  double length = 0.0;
  Orientation orientation = Orientation::kVertical;

  // First element is the negative side (smaller x or y), second the positive side.
  [[nodiscard]] std::pair<Vec2d, Vec2d> endpoints() const {
    const double half = length / 2.0;
    if (orientation == Orientation::kHorizontal) {
      return {{center.x - half, center.y}, {center.x + half, center.y}};
    }
    return {{center.x, center.y - half}, {center.x, center.y + half}};
  }

  bool operator==(const Segment& other) const {
    return center == other.center && orientation == other.orientation;
  }
};

struct SegmentHash {
  std::size_t operator()(const Segment& segment) const {
    return hash_combine(Vec2dHash{}(segment.center),
                        std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(segment.orientation)));
  }
};

}  // namespace toothpick::core
