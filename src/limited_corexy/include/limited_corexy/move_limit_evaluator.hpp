#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / move_limit_evaluator.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Per-move velocity / acceleration caps that keep each CoreXY belt motor
// within its own acceleration ceiling.
//
// Inputs
// ------
// - MoveDescriptor   displacement (x, y, z) and length of the move
// - AxisLimits       snapshot of the per-axis ceilings and scale policy
// - ToolheadLimits   requested velocity / acceleration and Z velocity ceiling
//
// Output
// ------
// MoveLimits { max_velocity, max_accel, max_cross_accel }, to be combined by
// the caller with any caps already on the move (minimum of each).
//
// XY step (only when ab_linf = max(|x+y|, |x-y|) > 0)
// -------
//   max_v  *= move_d / ab_linf
//   base    = scale_per_axis ? requested_accel * move_d / config_max_accel
//                            : move_d
//   max_pa  = base / max(|x/ay + y/ax|, |x/ay - y/ax|)     (cross pairing)
//   max_a   = base / max(|x/ax + y/ay|, |x/ax - y/ay|)     (own pairing)
//
// Z step (only when z != 0)
// ------
//   max_v = min(max_v, max_z_velocity * move_d / |z|)
//   max_a = min(max_a, max_z_accel    * move_d / |z|)
//
// Evaluated form
// --------------
// The XY step is computed on (xn, yn) = (x, y) / ab_linf, so |xn| + |yn| == 1
// and each denominator is at least 1 / (2 * max(ax, ay)). Dividing the raw
// components instead underflows to zero for subnormal x or y. Results that
// overflow (XY component tiny against move_d) saturate to the largest finite
// double, so every cap is finite and positive whenever the XY step runs.
// =============================================================================

#include <optional>

#include "limited_corexy/axis_limit_store.hpp"
#include "limited_corexy/move.hpp"

namespace limited_corexy
{

class MoveLimitEvaluator
{
public:
  // std::nullopt for moves without Cartesian semantics (extrude-only).
  static std::optional<MoveLimits> evaluate(
    const MoveDescriptor & move,
    const AxisLimits & limits,
    const ToolheadLimits & toolhead);
};

}  // namespace limited_corexy
