// =============================================================================
// Limited CoreXY | limited_corexy / src/kinematics/limited_corexy_kinematics.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/limited_corexy_kinematics.hpp"

namespace limited_corexy
{

void LimitedCoreXYKinematics::check_move(PlannedMove & move, const ToolheadLimits & toolhead) const
{
  const MoveDescriptor & d = move.descriptor();
  transform_.check_endstops(d);

  const auto limits = evaluate(d, toolhead);
  if (!limits) {
    return;
  }
  move.limit_speed(limits->max_velocity, limits->max_accel, limits->max_cross_accel);
}

}  // namespace limited_corexy
