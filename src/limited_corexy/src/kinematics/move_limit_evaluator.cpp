// =============================================================================
// Limited CoreXY | limited_corexy / src/kinematics/move_limit_evaluator.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/move_limit_evaluator.hpp"

#include <algorithm>
#include <cmath>

#include "limited_corexy/control_math.hpp"

namespace limited_corexy
{

std::optional<MoveLimits> MoveLimitEvaluator::evaluate(
  const MoveDescriptor & move,
  const AxisLimits & limits,
  const ToolheadLimits & toolhead)
{
  if (!move.is_kinematic_move) {
    return std::nullopt;
  }

  double max_v = toolhead.max_velocity;
  double max_a = toolhead.max_accel;
  double max_pa = max_a;

  const double move_d = move.move_d;
  const double x = move.axes_d[0];
  const double y = move.axes_d[1];
  const double z = move.axes_d[2];

  const double ab_linf = ControlMath::belt_linf(x, y);
  if (ab_linf > 0.0) {
    // Work with the direction normalised by the belt projection: |xn|, |yn| <= 1
    // and max(|xn|, |yn|) >= 1/2, so the ratios below cannot underflow to zero.
    const double xn = x / ab_linf;
    const double yn = y / ab_linf;
    const double d_o_ab = ControlMath::saturate(move_d / ab_linf);

    max_v = ControlMath::saturate(max_v * d_o_ab);

    double base_o_ab = d_o_ab;
    if (limits.scale_per_axis) {
      base_o_ab = ControlMath::saturate(max_a / limits.config_max_accel * d_o_ab);
    }

    max_pa = ControlMath::saturate(
      base_o_ab / ControlMath::belt_linf(xn / limits.max_y_accel, yn / limits.max_x_accel));
    max_a = ControlMath::saturate(
      base_o_ab / ControlMath::belt_linf(xn / limits.max_x_accel, yn / limits.max_y_accel));
  }

  if (z != 0.0) {
    const double z_ratio = move_d / std::abs(z);
    max_v = std::min(max_v, toolhead.max_z_velocity * z_ratio);
    max_a = std::min(max_a, limits.max_z_accel * z_ratio);
  }

  MoveLimits out;
  out.max_velocity = max_v;
  out.max_accel = max_a;
  out.max_cross_accel = max_pa;
  return out;
}

}  // namespace limited_corexy
