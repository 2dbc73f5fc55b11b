#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / limited_corexy_kinematics.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// CoreXY kinematics with per-motor acceleration limits.
//
// Wraps a CoreXYTransform (coordinate transform + travel range) and an
// AxisLimitStore (per-axis ceilings). Transform operations are forwarded to
// the wrapped transform; check_move() adds the limiting:
//
//   1) endstop range check (every move)
//   2) MoveLimitEvaluator on one store snapshot (kinematic moves only)
//   3) move.limit_speed(max_v, max_a, max_pa)
//
// Both collaborators are owned by the caller and must outlive this object.
// =============================================================================

#include <cstddef>
#include <optional>

#include "limited_corexy/axis_limit_store.hpp"
#include "limited_corexy/corexy_transform.hpp"
#include "limited_corexy/move.hpp"
#include "limited_corexy/move_limit_evaluator.hpp"

namespace limited_corexy
{

class LimitedCoreXYKinematics
{
public:
  LimitedCoreXYKinematics(CoreXYTransform & transform, const AxisLimitStore & store)
  : transform_(transform),
    store_(store)
  {}

  // ---------------------------------------------------------------------------
  // Forwarded transform operations
  // ---------------------------------------------------------------------------
  Vector3 calc_position(const Vector3 & stepper_pos) const
  {
    return transform_.calc_position(stepper_pos);
  }

  Vector3 motor_position(const Vector3 & cartesian_pos) const
  {
    return transform_.motor_position(cartesian_pos);
  }

  void set_axis_range(std::size_t axis, double min, double max)
  {
    transform_.set_axis_range(axis, min, max);
  }

  void clear_homing_state()
  {
    transform_.clear_homing_state();
  }

  // ---------------------------------------------------------------------------
  // Limiting
  // ---------------------------------------------------------------------------
  // Throws MoveError when the endstop check rejects the move; the move's caps
  // are left untouched in that case.
  void check_move(PlannedMove & move, const ToolheadLimits & toolhead) const;

  std::optional<MoveLimits> evaluate(
    const MoveDescriptor & move,
    const ToolheadLimits & toolhead) const
  {
    return MoveLimitEvaluator::evaluate(move, store_.snapshot(), toolhead);
  }

private:
  CoreXYTransform & transform_;
  const AxisLimitStore & store_;
};

}  // namespace limited_corexy
