#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / move.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Plain move-side data used by the limiter:
//
//   MoveDescriptor   geometry of one straight-line move (read-only to limiter)
//   ToolheadLimits   currently requested toolhead velocity / acceleration
//   MoveLimits       result of one limiter evaluation
//   PlannedMove      move object owned by the planner; limit_speed() sink
//
// Axis order everywhere is x, y, z, e. Only x, y, z take part in limiting.
// =============================================================================

#include <array>
#include <cstddef>

namespace limited_corexy
{

inline constexpr std::size_t kNumAxes = 4;

using AxisVector = std::array<double, kNumAxes>;

struct MoveDescriptor
{
  AxisVector axes_d {};             // signed displacement per axis
  AxisVector end_pos {};            // absolute target position
  double move_d {0.0};              // Euclidean length (xyz, or |e| if extrude-only)
  bool is_kinematic_move {true};    // false for extrude-only moves
};

struct ToolheadLimits
{
  double max_velocity {0.0};        // mm/s
  double max_accel {0.0};           // mm/s^2, currently requested baseline
  double max_z_velocity {0.0};      // mm/s
};

struct MoveLimits
{
  double max_velocity {0.0};
  double max_accel {0.0};
  double max_cross_accel {0.0};
};

// -----------------------------------------------------------------------------
// Planner move object
// -----------------------------------------------------------------------------
class PlannedMove
{
public:
  // Moves whose XYZ length is below this are treated as extrude-only.
  static constexpr double kMinKinematicLength = 1e-9;

  PlannedMove(
    const AxisVector & start_pos,
    const AxisVector & end_pos,
    double speed,
    const ToolheadLimits & toolhead);

  const MoveDescriptor & descriptor() const
  {
    return descriptor_;
  }

  // Tighten the move's caps; each argument only ever lowers its cap.
  void limit_speed(double speed, double accel, double cross_accel);

  double max_cruise_v2() const
  {
    return max_cruise_v2_;
  }

  double accel() const
  {
    return accel_;
  }

  double cross_accel() const
  {
    return cross_accel_;
  }

  double min_move_t() const
  {
    return min_move_t_;
  }

  double delta_v2() const
  {
    return delta_v2_;
  }

private:
  MoveDescriptor descriptor_ {};

  double max_cruise_v2_ {0.0};
  double accel_ {0.0};
  double cross_accel_ {0.0};
  double min_move_t_ {0.0};
  double delta_v2_ {0.0};
};

}  // namespace limited_corexy
