#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / axis_limit_store.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Mutable per-axis acceleration configuration for the limited CoreXY
// kinematics, plus the scale policy flag.
//
// What it holds
// -------------
// - config_max_accel   baseline captured at construction, never changes
// - max_x_accel        ceiling for the X belt combination
// - max_y_accel        ceiling for the Y belt combination
// - max_z_accel        ceiling for the Z axis
// - scale_per_axis     true  -> per-axis ceilings scale with requested accel
//                      false -> per-axis ceilings are independent of it
//
// Consistency
// -----------
// Every read goes through snapshot(), every write through set_limits(); both
// hold the same mutex. A reader therefore sees the complete pre-update or the
// complete post-update limits, never a mix of fields.
//
// set_limits() validates every supplied field before writing any of them.
// =============================================================================

#include <mutex>
#include <optional>

namespace limited_corexy
{

// -----------------------------------------------------------------------------
// Value snapshot
// -----------------------------------------------------------------------------
struct AxisLimits
{
  double config_max_accel {0.0};
  double max_x_accel {0.0};
  double max_y_accel {0.0};
  double max_z_accel {0.0};
  bool scale_per_axis {false};
};

// Partial update (unset fields keep their current value)
struct AxisLimitUpdate
{
  std::optional<double> x_accel {};
  std::optional<double> y_accel {};
  std::optional<double> z_accel {};
  std::optional<bool> scale {};
};

// Lowest XY acceleration reachable under per-axis limiting and its direction
struct DiagonalMinimum
{
  double min_accel {0.0};
  double angle_deg {0.0};
};

// -----------------------------------------------------------------------------
// Store
// -----------------------------------------------------------------------------
class AxisLimitStore
{
public:
  // Unset per-axis values default to config_max_accel.
  // Throws ConfigError if config_max_accel or any supplied value is not a
  // positive finite number.
  AxisLimitStore(
    double config_max_accel,
    std::optional<double> max_x_accel,
    std::optional<double> max_y_accel,
    std::optional<double> max_z_accel,
    bool scale_per_axis);

  AxisLimitStore(const AxisLimitStore &) = delete;
  AxisLimitStore & operator=(const AxisLimitStore &) = delete;

  AxisLimits snapshot() const;

  // Applies all supplied fields or none of them.
  // Accelerations must satisfy 0 < v <= config_max_accel, else RangeError.
  // Returns the limits as they are after the update.
  AxisLimits set_limits(const AxisLimitUpdate & update);

  DiagonalMinimum diagonal_minimum_accel() const;

  static DiagonalMinimum diagonal_minimum_accel(const AxisLimits & limits);

private:
  void check_runtime_accel_(const char * name, const std::optional<double> & value) const;

  const double config_max_accel_;

  mutable std::mutex mutex_;
  AxisLimits limits_ {};
};

}  // namespace limited_corexy
