#pragma once

#include <cstddef>
#include <functional>

namespace toothpick::core {

struct Vec2d {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Vec2d& other) const { return x == other.x && y == other.y; }
};

inline Vec2d operator+(const Vec2d& a, const Vec2d& b) {
  return {a.x + b.x, a.y + b.y};
}

inline Vec2d operator-(const Vec2d& a, const Vec2d& b) {
  return {a.x - b.x, a.y - b.y};
}

// Axis-aligned extent in the (min_x, max_x, min_y, max_y) order used by bounds().
struct Bounds2d {
  double min_x = 0.0;
  double max_x = 0.0;
  double min_y = 0.0;
  double max_y = 0.0;

  [[nodiscard]] double width() const { return max_x - min_x; }
  [[nodiscard]] double height() const { return max_y - min_y; }
  [[nodiscard]] Vec2d center() const { return {(min_x + max_x) * 0.5, (min_y + max_y) * 0.5}; }
};

inline std::size_t hash_combine(std::size_t h1, std::size_t h2) {
  return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
}

struct Vec2dHash {
  std::size_t operator()(const Vec2d& p) const {
    // -0.0 and 0.0 compare equal and must land in the same bucket.
    const double x = (p.x == 0.0) ? 0.0 : p.x;
    const double y = (p.y == 0.0) ? 0.0 : p.y;
    return hash_combine(std::hash<double>{}(x), std::hash<double>{}(y));
  }
};

}  // namespace toothpick::core
