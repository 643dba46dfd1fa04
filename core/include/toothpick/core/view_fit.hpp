#pragma once

#include "toothpick/core/types.hpp"

namespace toothpick::core {

struct ViewFit {
  Vec2d center{};
  double scale = 1.0;
};

// Centers the bounds and scales them to fit the viewport minus padding on each side.
[[nodiscard]] ViewFit compute_view_fit(const Bounds2d& bounds, double viewport_width, double viewport_height,
                                       double padding);

[[nodiscard]] ViewFit smooth_view_fit(const ViewFit& current, const ViewFit& target, double zoom_speed);

// Screen-space offset of the world origin, i.e. the top-left corner of the view in world units.
[[nodiscard]] Vec2d view_origin(const ViewFit& fit, double viewport_width, double viewport_height);

class ViewSmoother {
 public:
  explicit ViewSmoother(double zoom_speed = 0.1) : zoom_speed_(zoom_speed) {}

  // First call snaps to the target; later calls ease toward it.
  const ViewFit& Update(const ViewFit& target);
  void Reset() { has_value_ = false; }

  [[nodiscard]] bool has_value() const { return has_value_; }
  [[nodiscard]] const ViewFit& current() const { return current_; }
  void set_zoom_speed(double zoom_speed) { zoom_speed_ = zoom_speed; }

 private:
  double zoom_speed_ = 0.1;
  bool has_value_ = false;
  ViewFit current_{};
};

}  // namespace toothpick::core
