#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / topic_names.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Topic name constants for the `limited_corexy` package, kept in one place so
// nodes and launch/test scripts agree on the interface.
// =============================================================================

namespace limited_corexy
{
namespace topic_names
{

// -----------------------------------------------------------------------------
// Operator commands
// -----------------------------------------------------------------------------
// Text command lines in, text responses out ("!! " prefix on errors)
inline constexpr const char * kGcodeCommand  = "/limited_corexy/gcode_cmd";
inline constexpr const char * kGcodeResponse = "/limited_corexy/gcode_response";

// -----------------------------------------------------------------------------
// Move limiting
// -----------------------------------------------------------------------------
inline constexpr const char * kMoveTarget = "/limited_corexy/move_target";   // geometry_msgs/Point
inline constexpr const char * kMoveLimits = "/limited_corexy/move_limits";   // std_msgs/String

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------
inline constexpr const char * kStatus = "/limited_corexy/status";

}  // namespace topic_names
}  // namespace limited_corexy
