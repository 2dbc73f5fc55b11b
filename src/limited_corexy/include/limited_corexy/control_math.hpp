#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / control_math.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Small, ROS-independent numeric helpers shared by the limiter, the command
// handler and the node:
//   - positive-finite validation and overflow saturation
//   - CoreXY belt projection (L-inf norm in motor-differential space)
//   - radian / degree conversion
//   - timer period from a rate
//   - nearest-integer rounding for operator reports
//
// Design note
// -----------
// Keep these helpers independent from ROS messages and node code so they can
// be unit tested without a running graph.
// =============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <type_traits>

namespace limited_corexy
{

class ControlMath
{
public:
  // ---------------------------------------------------------------------------
  // Constants
  // ---------------------------------------------------------------------------
  static constexpr double kPi = 3.1415926535897932384626433832795;

  // ---------------------------------------------------------------------------
  // Valid checks
  // ---------------------------------------------------------------------------
  static inline bool is_positive_finite(double value)
  {
    return std::isfinite(value) && (value > 0.0);
  }

  // Overflow to +inf becomes the largest finite double.
  static inline double saturate(double value)
  {
    return std::min(value, std::numeric_limits<double>::max());
  }

  // ---------------------------------------------------------------------------
  // CoreXY projection
  // ---------------------------------------------------------------------------
  // max(|u + v|, |u - v|), equal to |u| + |v|.
  // With (u, v) = (x, y) this is the travel of the more loaded belt motor.
  static inline double belt_linf(double u, double v)
  {
    return std::max(std::abs(u + v), std::abs(u - v));
  }

  // ---------------------------------------------------------------------------
  // Unit / formatting helpers
  // ---------------------------------------------------------------------------
  static inline double rad_to_deg(double rad)
  {
    return rad * (180.0 / kPi);
  }

  // Period of a timer running at rate_hz (> 0), clamped to what a
  // std::chrono::nanoseconds can hold and never shorter than 1 ns.
  static inline std::chrono::nanoseconds rate_to_period(double rate_hz)
  {
    const double max_ns =
      static_cast<double>(std::chrono::nanoseconds::max().count() / 2);
    const double ns = std::clamp(1e9 / rate_hz, 1.0, max_ns);
    return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(ns));
  }

  template<typename T>
  static long round_to_long(const T value)
  {
    static_assert(std::is_floating_point<T>::value, "ControlMath::round_to_long requires floating type");
    return std::lround(value);
  }
};

}  // namespace limited_corexy
