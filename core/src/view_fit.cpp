#include "toothpick/core/view_fit.hpp"

#include <algorithm>

namespace toothpick::core {

ViewFit compute_view_fit(const Bounds2d& bounds, double viewport_width, double viewport_height, double padding) {
  const double scale_x = (viewport_width - 2.0 * padding) / std::max(bounds.width(), 1.0);
  const double scale_y = (viewport_height - 2.0 * padding) / std::max(bounds.height(), 1.0);
  return {bounds.center(), std::min(scale_x, scale_y)};
}

ViewFit smooth_view_fit(const ViewFit& current, const ViewFit& target, double zoom_speed) {
  ViewFit out = current;
  out.center.x += (target.center.x - current.center.x) * zoom_speed;
  out.center.y += (target.center.y - current.center.y) * zoom_speed;
  out.scale += (target.scale - current.scale) * zoom_speed;
  return out;
}

Vec2d view_origin(const ViewFit& fit, double viewport_width, double viewport_height) {
  return {fit.center.x - viewport_width / (2.0 * fit.scale), fit.center.y - viewport_height / (2.0 * fit.scale)};
}

const ViewFit& ViewSmoother::Update(const ViewFit& target) {
  if (!has_value_) {
    current_ = target;
    has_value_ = true;
  } else {
    current_ = smooth_view_fit(current_, target, zoom_speed_);
  }
  return current_;
}

}  // namespace toothpick::core
