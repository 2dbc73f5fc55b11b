// =============================================================================
// Limited CoreXY | limited_corexy / src/kinematics/move.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/move.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "limited_corexy/control_math.hpp"
#include "limited_corexy/limit_errors.hpp"

namespace limited_corexy
{

namespace
{
// Acceleration cap of an extrude-only move before any limiting.
constexpr double kExtrudeOnlyAccel = 99999999.9;
}  // namespace

PlannedMove::PlannedMove(
  const AxisVector & start_pos,
  const AxisVector & end_pos,
  double speed,
  const ToolheadLimits & toolhead)
{
  if (!ControlMath::is_positive_finite(speed)) {
    std::ostringstream ss;
    ss << "Invalid speed " << speed << " (must be above 0)";
    throw RangeError(ss.str());
  }

  descriptor_.end_pos = end_pos;
  for (std::size_t i = 0; i < kNumAxes; ++i) {
    descriptor_.axes_d[i] = end_pos[i] - start_pos[i];
  }

  const auto & d = descriptor_.axes_d;
  descriptor_.move_d = std::sqrt(d[0] * d[0] + d[1] * d[1] + d[2] * d[2]);

  double velocity = std::min(speed, toolhead.max_velocity);
  accel_ = toolhead.max_accel;

  if (descriptor_.move_d < kMinKinematicLength) {
    // Extrude-only: keep the toolhead where it is, travel is the filament length
    for (std::size_t i = 0; i < 3; ++i) {
      descriptor_.end_pos[i] = start_pos[i];
      descriptor_.axes_d[i] = 0.0;
    }
    descriptor_.move_d = std::abs(descriptor_.axes_d[3]);
    descriptor_.is_kinematic_move = false;
    velocity = speed;
    accel_ = kExtrudeOnlyAccel;
  }

  cross_accel_ = accel_;
  max_cruise_v2_ = velocity * velocity;
  min_move_t_ = descriptor_.move_d / velocity;
  delta_v2_ = 2.0 * descriptor_.move_d * accel_;
}

void PlannedMove::limit_speed(double speed, double accel, double cross_accel)
{
  const double speed2 = speed * speed;
  if (speed2 < max_cruise_v2_) {
    max_cruise_v2_ = speed2;
    min_move_t_ = descriptor_.move_d / speed;
  }
  accel_ = std::min(accel_, accel);
  cross_accel_ = std::min(cross_accel_, cross_accel);
  delta_v2_ = 2.0 * descriptor_.move_d * accel_;
}

}  // namespace limited_corexy
