#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / corexy_transform.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Base CoreXY coordinate transform between belt motor space (a, b, z) and
// Cartesian space (x, y, z), plus the per-axis travel range used to reject
// moves that leave the machine envelope.
//
//   a = x + y        x = (a + b) / 2
//   b = x - y        y = (a - b) / 2
//
// An axis is "homed" once a valid range (min <= max) has been set for it.
// Homing itself happens elsewhere; this class only records the result.
// =============================================================================

#include <array>
#include <cstddef>

#include "limited_corexy/move.hpp"

namespace limited_corexy
{

using Vector3 = std::array<double, 3>;

struct AxisRange
{
  double min {1.0};   // min > max means "not homed"
  double max {-1.0};

  bool valid() const
  {
    return min <= max;
  }
};

class CoreXYTransform
{
public:
  static constexpr std::size_t kNumLinearAxes = 3;

  CoreXYTransform() = default;

  // (a, b, z) stepper positions -> (x, y, z)
  Vector3 calc_position(const Vector3 & stepper_pos) const;

  // (x, y, z) -> (a, b, z) stepper positions
  Vector3 motor_position(const Vector3 & cartesian_pos) const;

  // Throws RangeError on a bad axis index or min > max.
  void set_axis_range(std::size_t axis, double min, double max);
  void clear_homing_state(std::size_t axis);
  void clear_homing_state();

  bool is_homed(std::size_t axis) const;
  const AxisRange & axis_range(std::size_t axis) const;

  // Throws MoveError if a moving axis ends outside its range.
  void check_endstops(const MoveDescriptor & move) const;

private:
  void check_axis_index_(std::size_t axis) const;

  std::array<AxisRange, kNumLinearAxes> ranges_ {};
};

}  // namespace limited_corexy
