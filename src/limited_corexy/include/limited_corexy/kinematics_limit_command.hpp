#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / kinematics_limit_command.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Operator command that inspects / updates an AxisLimitStore:
//
//   SET_KINEMATICS_LIMIT [X_ACCEL=<mm/s^2>] [Y_ACCEL=<mm/s^2>]
//                        [Z_ACCEL=<mm/s^2>] [SCALE=0|1]
//
// Omitted parameters keep their current value. Accelerations must be in
// (0, config_max_accel]. All parameters are parsed and validated before the
// store is touched, so a rejected command changes nothing.
//
// Response (three lines):
//   x,y,z max_accels: [<x>, <y>, <z>]
//   <policy sentence>
//   Minimum XY acceleration of <accel> mm/s² reached on <angle>° diagonals.
// =============================================================================

#include <string>

#include "limited_corexy/axis_limit_store.hpp"
#include "limited_corexy/command_dispatcher.hpp"

namespace limited_corexy
{

class KinematicsLimitCommand
{
public:
  static constexpr const char * kName = "SET_KINEMATICS_LIMIT";
  static constexpr const char * kHelp =
    "Set per-axis acceleration limits (X_ACCEL, Y_ACCEL, Z_ACCEL, SCALE)";

  explicit KinematicsLimitCommand(AxisLimitStore & store)
  : store_(store)
  {}

  // Parse + apply + report. Throws CommandError / RangeError.
  std::string handle(const CommandLine & cmd);

  // Apply an already parsed update and report.
  std::string execute(const AxisLimitUpdate & update);

  void register_with(CommandDispatcher & dispatcher);

  static std::string format_report(const AxisLimits & limits);

private:
  AxisLimitStore & store_;
};

}  // namespace limited_corexy
