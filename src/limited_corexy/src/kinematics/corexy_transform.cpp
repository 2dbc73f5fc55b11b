// =============================================================================
// Limited CoreXY | limited_corexy / src/kinematics/corexy_transform.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/corexy_transform.hpp"

#include <cmath>
#include <sstream>

#include "limited_corexy/limit_errors.hpp"

namespace limited_corexy
{

namespace
{
const char * axis_name(std::size_t axis)
{
  switch (axis) {
    case 0: return "x";
    case 1: return "y";
    case 2: return "z";
    default: return "?";
  }
}
}  // namespace

Vector3 CoreXYTransform::calc_position(const Vector3 & stepper_pos) const
{
  return Vector3{
    0.5 * (stepper_pos[0] + stepper_pos[1]),
    0.5 * (stepper_pos[0] - stepper_pos[1]),
    stepper_pos[2]};
}

Vector3 CoreXYTransform::motor_position(const Vector3 & cartesian_pos) const
{
  return Vector3{
    cartesian_pos[0] + cartesian_pos[1],
    cartesian_pos[0] - cartesian_pos[1],
    cartesian_pos[2]};
}

void CoreXYTransform::set_axis_range(std::size_t axis, double min, double max)
{
  check_axis_index_(axis);
  if (!std::isfinite(min) || !std::isfinite(max) || min > max) {
    std::ostringstream ss;
    ss << "Invalid " << axis_name(axis) << " range [" << min << ", " << max << "]";
    throw RangeError(ss.str());
  }
  ranges_[axis].min = min;
  ranges_[axis].max = max;
}

void CoreXYTransform::clear_homing_state(std::size_t axis)
{
  check_axis_index_(axis);
  ranges_[axis] = AxisRange{};
}

void CoreXYTransform::clear_homing_state()
{
  ranges_.fill(AxisRange{});
}

bool CoreXYTransform::is_homed(std::size_t axis) const
{
  return axis_range(axis).valid();
}

const AxisRange & CoreXYTransform::axis_range(std::size_t axis) const
{
  check_axis_index_(axis);
  return ranges_[axis];
}

void CoreXYTransform::check_endstops(const MoveDescriptor & move) const
{
  for (std::size_t i = 0; i < kNumLinearAxes; ++i) {
    if (move.axes_d[i] == 0.0) {
      continue;
    }
    const double end = move.end_pos[i];
    const AxisRange & r = ranges_[i];
    if (end >= r.min && end <= r.max) {
      continue;
    }
    if (!r.valid()) {
      throw MoveError("Must home axis first");
    }
    std::ostringstream ss;
    ss << "Move out of range: " << move.end_pos[0] << " " << move.end_pos[1] << " "
       << move.end_pos[2] << " [" << move.end_pos[3] << "]";
    throw MoveError(ss.str());
  }
}

void CoreXYTransform::check_axis_index_(std::size_t axis) const
{
  if (axis >= kNumLinearAxes) {
    std::ostringstream ss;
    ss << "Axis index " << axis << " out of range";
    throw RangeError(ss.str());
  }
}

}  // namespace limited_corexy
