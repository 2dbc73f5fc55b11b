// =============================================================================
// Limited CoreXY | limited_corexy / src/commands/kinematics_limit_command.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/kinematics_limit_command.hpp"

#include <sstream>

#include "limited_corexy/control_math.hpp"

namespace limited_corexy
{

std::string KinematicsLimitCommand::handle(const CommandLine & cmd)
{
  ValueBounds scale_bounds;
  scale_bounds.minval = 0.0;
  scale_bounds.maxval = 1.0;

  AxisLimitUpdate update;
  update.x_accel = cmd.get_optional_float("X_ACCEL");
  update.y_accel = cmd.get_optional_float("Y_ACCEL");
  update.z_accel = cmd.get_optional_float("Z_ACCEL");

  const auto scale = cmd.get_optional_int("SCALE", scale_bounds);
  if (scale) {
    update.scale = (*scale != 0);
  }

  return execute(update);
}

std::string KinematicsLimitCommand::execute(const AxisLimitUpdate & update)
{
  return format_report(store_.set_limits(update));
}

void KinematicsLimitCommand::register_with(CommandDispatcher & dispatcher)
{
  dispatcher.register_command(
    kName,
    [this](const CommandLine & cmd) { return handle(cmd); },
    kHelp);
}

std::string KinematicsLimitCommand::format_report(const AxisLimits & limits)
{
  const DiagonalMinimum diag = AxisLimitStore::diagonal_minimum_accel(limits);

  std::ostringstream ss;
  ss << "x,y,z max_accels: ["
     << limits.max_x_accel << ", "
     << limits.max_y_accel << ", "
     << limits.max_z_accel << "]\n";

  if (limits.scale_per_axis) {
    ss << "Per axis accelerations limits scale with current acceleration.\n";
  } else {
    ss << "Per axis accelerations limits are independent of current acceleration.\n";
  }

  ss << "Minimum XY acceleration of " << ControlMath::round_to_long(diag.min_accel)
     << " mm/s² reached on " << ControlMath::round_to_long(diag.angle_deg)
     << "° diagonals.";
  return ss.str();
}

}  // namespace limited_corexy
