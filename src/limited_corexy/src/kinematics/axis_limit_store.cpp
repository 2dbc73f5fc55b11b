// =============================================================================
// Limited CoreXY | limited_corexy / src/kinematics/axis_limit_store.cpp (ROS 2 Jazzy)
// =============================================================================
// Validation and locking for AxisLimitStore.
// =============================================================================

#include "limited_corexy/axis_limit_store.hpp"

#include <cmath>
#include <sstream>
#include <string>

#include "limited_corexy/control_math.hpp"
#include "limited_corexy/limit_errors.hpp"

namespace limited_corexy
{

namespace
{

double config_accel_or_default(
  const char * name,
  const std::optional<double> & value,
  double fallback)
{
  if (!value.has_value()) {
    return fallback;
  }
  if (!ControlMath::is_positive_finite(*value)) {
    std::ostringstream ss;
    ss << "Option '" << name << "' must be above 0 (got " << *value << ")";
    throw ConfigError(ss.str());
  }
  return *value;
}

double checked_config_max_accel(double value)
{
  if (!ControlMath::is_positive_finite(value)) {
    std::ostringstream ss;
    ss << "Option 'max_accel' must be above 0 (got " << value << ")";
    throw ConfigError(ss.str());
  }
  return value;
}

}  // namespace

AxisLimitStore::AxisLimitStore(
  double config_max_accel,
  std::optional<double> max_x_accel,
  std::optional<double> max_y_accel,
  std::optional<double> max_z_accel,
  bool scale_per_axis)
: config_max_accel_(checked_config_max_accel(config_max_accel))
{
  limits_.config_max_accel = config_max_accel_;
  limits_.max_x_accel = config_accel_or_default("max_x_accel", max_x_accel, config_max_accel_);
  limits_.max_y_accel = config_accel_or_default("max_y_accel", max_y_accel, config_max_accel_);
  limits_.max_z_accel = config_accel_or_default("max_z_accel", max_z_accel, config_max_accel_);
  limits_.scale_per_axis = scale_per_axis;
}

AxisLimits AxisLimitStore::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_;
}

AxisLimits AxisLimitStore::set_limits(const AxisLimitUpdate & update)
{
  // Validate everything first: a rejected update must leave no trace.
  check_runtime_accel_("X_ACCEL", update.x_accel);
  check_runtime_accel_("Y_ACCEL", update.y_accel);
  check_runtime_accel_("Z_ACCEL", update.z_accel);

  std::lock_guard<std::mutex> lock(mutex_);
  if (update.x_accel) {
    limits_.max_x_accel = *update.x_accel;
  }
  if (update.y_accel) {
    limits_.max_y_accel = *update.y_accel;
  }
  if (update.z_accel) {
    limits_.max_z_accel = *update.z_accel;
  }
  if (update.scale) {
    limits_.scale_per_axis = *update.scale;
  }
  return limits_;
}

DiagonalMinimum AxisLimitStore::diagonal_minimum_accel() const
{
  return diagonal_minimum_accel(snapshot());
}

DiagonalMinimum AxisLimitStore::diagonal_minimum_accel(const AxisLimits & limits)
{
  const double ax = limits.max_x_accel;
  const double ay = limits.max_y_accel;

  DiagonalMinimum out;
  out.min_accel = 1.0 / std::sqrt(1.0 / (ax * ax) + 1.0 / (ay * ay));
  out.angle_deg = ControlMath::rad_to_deg(std::atan2(ax, ay));
  return out;
}

void AxisLimitStore::check_runtime_accel_(
  const char * name,
  const std::optional<double> & value) const
{
  if (!value.has_value()) {
    return;
  }

  const double v = *value;
  if (!ControlMath::is_positive_finite(v)) {
    std::ostringstream ss;
    ss << name << " must be above 0 (got " << v << ")";
    throw RangeError(ss.str());
  }
  if (v > config_max_accel_) {
    std::ostringstream ss;
    ss << name << " must have maximum of " << config_max_accel_ << " (got " << v << ")";
    throw RangeError(ss.str());
  }
}

}  // namespace limited_corexy
