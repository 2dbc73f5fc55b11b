#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / limited_corexy_node.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// ROS 2 host for the limited CoreXY kinematics.
//
//   /limited_corexy/gcode_cmd  (String) -> CommandDispatcher -> /limited_corexy/gcode_response
//   /limited_corexy/move_target (Point) -> PlannedMove -> check_move -> /limited_corexy/move_limits
//   timer                               -> /limited_corexy/status
//
// Registered commands
// -------------------
// - SET_KINEMATICS_LIMIT [X_ACCEL=] [Y_ACCEL=] [Z_ACCEL=] [SCALE=0|1]
// - SET_VELOCITY_LIMIT   [VELOCITY=] [ACCEL=]   (requested toolhead limits)
// - HELP
//
// Notes
// -----
// - Limiting math lives in the library (move_limit_evaluator.hpp); this node
//   only does parameter loading, topic I/O and logging.
// - Start-up configuration errors abort the node (ConfigError, see main()).
// - Runtime command / move errors are logged and answered with "!! <message>";
//   the node keeps running and no state is changed.
// =============================================================================

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "geometry_msgs/msg/point.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

#include "limited_corexy/axis_limit_store.hpp"
#include "limited_corexy/command_dispatcher.hpp"
#include "limited_corexy/control_math.hpp"
#include "limited_corexy/corexy_transform.hpp"
#include "limited_corexy/kinematics_limit_command.hpp"
#include "limited_corexy/limit_errors.hpp"
#include "limited_corexy/limited_corexy_kinematics.hpp"
#include "limited_corexy/move.hpp"
#include "limited_corexy/topic_names.hpp"

namespace limited_corexy
{

class LimitedCoreXYNode : public rclcpp::Node
{
public:
  explicit LimitedCoreXYNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions())
  : Node("limited_corexy_node", options)
  {
    // Wrong-typed overrides (e.g. an integer where a double is expected) are
    // configuration errors like any other.
    try {
      declare_parameters_();
      load_parameters_();
    } catch (const rclcpp::exceptions::InvalidParameterTypeException & e) {
      throw ConfigError(e.what());
    } catch (const rclcpp::exceptions::InvalidParameterValueException & e) {
      throw ConfigError(e.what());
    } catch (const rclcpp::ParameterTypeException & e) {
      throw ConfigError(e.what());
    }

    // -------------------------------------------------------------------------
    // Kinematics (store + transform + decorator)
    // -------------------------------------------------------------------------
    store_ = std::make_unique<AxisLimitStore>(
      toolhead_.max_accel, max_x_accel_, max_y_accel_, max_z_accel_, scale_xy_accel_);

    kinematics_ = std::make_unique<LimitedCoreXYKinematics>(transform_, *store_);

    if (assume_homed_) {
      for (std::size_t i = 0; i < CoreXYTransform::kNumLinearAxes; ++i) {
        try {
          kinematics_->set_axis_range(i, position_min_[i], position_max_[i]);
        } catch (const RangeError & e) {
          throw ConfigError(std::string("position_min/position_max: ") + e.what());
        }
      }
    }

    // -------------------------------------------------------------------------
    // Commands (explicit registration)
    // -------------------------------------------------------------------------
    limit_cmd_ = std::make_unique<KinematicsLimitCommand>(*store_);
    limit_cmd_->register_with(dispatcher_);

    dispatcher_.register_command(
      "SET_VELOCITY_LIMIT",
      std::bind(&LimitedCoreXYNode::cmd_set_velocity_limit_, this, std::placeholders::_1),
      "Set requested toolhead velocity / acceleration (VELOCITY, ACCEL)");

    dispatcher_.register_command(
      "HELP",
      std::bind(&LimitedCoreXYNode::cmd_help_, this, std::placeholders::_1),
      "List available commands");

    // -------------------------------------------------------------------------
    // Publishers / Subscribers
    // -------------------------------------------------------------------------
    pub_response_ = this->create_publisher<std_msgs::msg::String>(
      topic_names::kGcodeResponse, rclcpp::QoS(10));

    pub_move_limits_ = this->create_publisher<std_msgs::msg::String>(
      topic_names::kMoveLimits, rclcpp::QoS(10));

    pub_status_ = this->create_publisher<std_msgs::msg::String>(
      topic_names::kStatus, rclcpp::QoS(10).transient_local());

    sub_command_ = this->create_subscription<std_msgs::msg::String>(
      topic_names::kGcodeCommand, rclcpp::QoS(10),
      std::bind(&LimitedCoreXYNode::on_command_, this, std::placeholders::_1));

    sub_move_target_ = this->create_subscription<geometry_msgs::msg::Point>(
      topic_names::kMoveTarget, rclcpp::QoS(10),
      std::bind(&LimitedCoreXYNode::on_move_target_, this, std::placeholders::_1));

    // -------------------------------------------------------------------------
    // Status timer
    // -------------------------------------------------------------------------
    timer_ = this->create_wall_timer(
      ControlMath::rate_to_period(status_rate_hz_),
      std::bind(&LimitedCoreXYNode::publish_status_, this));

    publish_status_();

    const AxisLimits limits = store_->snapshot();
    const DiagonalMinimum diag = AxisLimitStore::diagonal_minimum_accel(limits);
    RCLCPP_INFO(
      this->get_logger(),
      "limited_corexy_node started | max_v=%.1f max_a=%.1f | x_accel=%.1f y_accel=%.1f "
      "z_accel=%.1f | scale_xy_accel=%s | diagonal min %.0f mm/s^2 @ %.0f deg | homed=%s",
      toolhead_.max_velocity, toolhead_.max_accel,
      limits.max_x_accel, limits.max_y_accel, limits.max_z_accel,
      limits.scale_per_axis ? "true" : "false",
      diag.min_accel, diag.angle_deg,
      assume_homed_ ? "true" : "false");
  }

  AxisLimits axis_limits() const
  {
    return store_->snapshot();
  }

  const ToolheadLimits & toolhead_limits() const
  {
    return toolhead_;
  }

private:
  // ---------------------------------------------------------------------------
  // Parameters
  // ---------------------------------------------------------------------------
  void declare_parameters_()
  {
    // Toolhead
    this->declare_parameter<double>("max_velocity", 300.0);
    this->declare_parameter<double>("max_accel", 3000.0);
    this->declare_parameter<double>("max_z_velocity", 25.0);

    // Per-axis limits (unset -> max_accel)
    this->declare_parameter("max_x_accel", rclcpp::ParameterType::PARAMETER_DOUBLE);
    this->declare_parameter("max_y_accel", rclcpp::ParameterType::PARAMETER_DOUBLE);
    this->declare_parameter("max_z_accel", rclcpp::ParameterType::PARAMETER_DOUBLE);
    this->declare_parameter<bool>("scale_xy_accel", false);

    // Travel envelope
    this->declare_parameter<std::vector<double>>("position_min", {0.0, 0.0, 0.0});
    this->declare_parameter<std::vector<double>>("position_max", {250.0, 250.0, 200.0});
    this->declare_parameter<bool>("assume_homed", true);

    // Move requests / status
    this->declare_parameter<double>("move_speed", 100.0);
    this->declare_parameter<double>("status_rate_hz", 1.0);
    this->declare_parameter<int>("log.debug_throttle_ms", 1000);
  }

  void load_parameters_()
  {
    toolhead_.max_velocity = positive_param_("max_velocity");
    toolhead_.max_accel = positive_param_("max_accel");
    toolhead_.max_z_velocity = positive_param_("max_z_velocity");

    max_x_accel_ = optional_double_param_("max_x_accel");
    max_y_accel_ = optional_double_param_("max_y_accel");
    max_z_accel_ = optional_double_param_("max_z_accel");
    scale_xy_accel_ = this->get_parameter("scale_xy_accel").as_bool();

    position_min_ = vector3_param_("position_min");
    position_max_ = vector3_param_("position_max");
    assume_homed_ = this->get_parameter("assume_homed").as_bool();

    move_speed_ = positive_param_("move_speed");
    status_rate_hz_ = this->get_parameter("status_rate_hz").as_double();
    log_debug_throttle_ms_ =
      static_cast<int>(this->get_parameter("log.debug_throttle_ms").as_int());

    if (!ControlMath::is_positive_finite(status_rate_hz_)) {
      status_rate_hz_ = 1.0;
    }
    if (log_debug_throttle_ms_ < 0) {
      log_debug_throttle_ms_ = 1000;
    }
  }

  double positive_param_(const std::string & name)
  {
    const double v = this->get_parameter(name).as_double();
    if (!ControlMath::is_positive_finite(v)) {
      std::ostringstream ss;
      ss << "Option '" << name << "' must be above 0 (got " << v << ")";
      throw ConfigError(ss.str());
    }
    return v;
  }

  std::optional<double> optional_double_param_(const std::string & name)
  {
    try {
      return this->get_parameter(name).as_double();
    } catch (const rclcpp::exceptions::ParameterUninitializedException &) {
      return std::nullopt;
    }
  }

  Vector3 vector3_param_(const std::string & name)
  {
    const auto v = this->get_parameter(name).as_double_array();
    if (v.size() != 3) {
      std::ostringstream ss;
      ss << "Option '" << name << "' must have 3 values (got " << v.size() << ")";
      throw ConfigError(ss.str());
    }
    return Vector3{v[0], v[1], v[2]};
  }

  // ---------------------------------------------------------------------------
  // Callbacks
  // ---------------------------------------------------------------------------
  void on_command_(const std_msgs::msg::String::SharedPtr msg)
  {
    if (!msg) {
      return;
    }

    std_msgs::msg::String out;
    try {
      out.data = dispatcher_.dispatch(msg->data);
      RCLCPP_INFO(this->get_logger(), "%s -> %s", msg->data.c_str(), out.data.c_str());
    } catch (const LimitError & e) {
      RCLCPP_WARN(this->get_logger(), "Command rejected: %s", e.what());
      out.data = std::string("!! ") + e.what();
    }
    pub_response_->publish(out);
  }

  void on_move_target_(const geometry_msgs::msg::Point::SharedPtr msg)
  {
    if (!msg) {
      return;
    }

    AxisVector target = current_pos_;
    target[0] = msg->x;
    target[1] = msg->y;
    target[2] = msg->z;

    try {
      PlannedMove move(current_pos_, target, move_speed_, toolhead_);
      kinematics_->check_move(move, toolhead_);
      current_pos_ = move.descriptor().end_pos;
      publish_move_limits_(move);
    } catch (const LimitError & e) {
      RCLCPP_WARN(this->get_logger(), "Move rejected: %s", e.what());
      std_msgs::msg::String out;
      out.data = std::string("!! ") + e.what();
      pub_response_->publish(out);
    }
  }

  // ---------------------------------------------------------------------------
  // Command handlers
  // ---------------------------------------------------------------------------
  std::string cmd_set_velocity_limit_(const CommandLine & cmd)
  {
    ValueBounds positive;
    positive.above = 0.0;

    // Parse both before applying either.
    const double velocity = cmd.get_float("VELOCITY", toolhead_.max_velocity, positive);
    const double accel = cmd.get_float("ACCEL", toolhead_.max_accel, positive);
    toolhead_.max_velocity = velocity;
    toolhead_.max_accel = accel;

    std::ostringstream ss;
    ss << "max_velocity: " << toolhead_.max_velocity << "\n"
       << "max_accel: " << toolhead_.max_accel;
    return ss.str();
  }

  std::string cmd_help_(const CommandLine &)
  {
    std::ostringstream ss;
    ss << "Available commands:";
    for (const auto & c : dispatcher_.commands()) {
      ss << "\n" << c.name << ": " << c.help;
    }
    return ss.str();
  }

  // ---------------------------------------------------------------------------
  // Publishers helpers
  // ---------------------------------------------------------------------------
  void publish_move_limits_(const PlannedMove & move)
  {
    const MoveDescriptor & d = move.descriptor();

    std_msgs::msg::String msg;
    std::ostringstream ss;
    ss << "{"
       << "\"move_d\":" << d.move_d << ","
       << "\"kinematic\":" << (d.is_kinematic_move ? "true" : "false") << ","
       << "\"max_velocity\":" << std::sqrt(move.max_cruise_v2()) << ","
       << "\"max_accel\":" << move.accel() << ","
       << "\"max_cross_accel\":" << move.cross_accel() << ","
       << "\"min_move_t\":" << move.min_move_t()
       << "}";
    msg.data = ss.str();
    pub_move_limits_->publish(msg);

    RCLCPP_DEBUG_THROTTLE(
      this->get_logger(), *this->get_clock(),
      std::max(0, log_debug_throttle_ms_),
      "move d=[%.3f %.3f %.3f] len=%.3f -> v=%.2f a=%.2f pa=%.2f",
      d.axes_d[0], d.axes_d[1], d.axes_d[2], d.move_d,
      std::sqrt(move.max_cruise_v2()), move.accel(), move.cross_accel());
  }

  void publish_status_()
  {
    const AxisLimits limits = store_->snapshot();
    const DiagonalMinimum diag = AxisLimitStore::diagonal_minimum_accel(limits);

    std_msgs::msg::String msg;
    std::ostringstream ss;
    ss << "{"
       << "\"node\":\"limited_corexy\","
       << "\"config_max_accel\":" << limits.config_max_accel << ","
       << "\"max_x_accel\":" << limits.max_x_accel << ","
       << "\"max_y_accel\":" << limits.max_y_accel << ","
       << "\"max_z_accel\":" << limits.max_z_accel << ","
       << "\"scale_xy_accel\":" << (limits.scale_per_axis ? "true" : "false") << ","
       << "\"diagonal_min_accel\":" << diag.min_accel << ","
       << "\"diagonal_angle_deg\":" << diag.angle_deg << ","
       << "\"max_velocity\":" << toolhead_.max_velocity << ","
       << "\"max_accel\":" << toolhead_.max_accel << ","
       << "\"position\":[" << current_pos_[0] << "," << current_pos_[1] << ","
       << current_pos_[2] << "]"
       << "}";
    msg.data = ss.str();
    pub_status_->publish(msg);
  }

private:
  // Kinematics
  CoreXYTransform transform_;
  std::unique_ptr<AxisLimitStore> store_;
  std::unique_ptr<LimitedCoreXYKinematics> kinematics_;

  // Commands
  CommandDispatcher dispatcher_;
  std::unique_ptr<KinematicsLimitCommand> limit_cmd_;

  // Toolhead state
  ToolheadLimits toolhead_ {};
  AxisVector current_pos_ {};

  // Params
  std::optional<double> max_x_accel_;
  std::optional<double> max_y_accel_;
  std::optional<double> max_z_accel_;
  bool scale_xy_accel_ {false};

  Vector3 position_min_ {};
  Vector3 position_max_ {};
  bool assume_homed_ {true};

  double move_speed_ {100.0};
  double status_rate_hz_ {1.0};
  int log_debug_throttle_ms_ {1000};

  // ROS interfaces
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_command_;
  rclcpp::Subscription<geometry_msgs::msg::Point>::SharedPtr sub_move_target_;

  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_response_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_move_limits_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_status_;

  rclcpp::TimerBase::SharedPtr timer_;
};

}  // namespace limited_corexy
