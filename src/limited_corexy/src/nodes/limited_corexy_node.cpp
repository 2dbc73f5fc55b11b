// =============================================================================
// Limited CoreXY | limited_corexy / src/nodes/limited_corexy_node.cpp (ROS 2 Jazzy)
// =============================================================================

#include <memory>

#include "rclcpp/rclcpp.hpp"

#include "limited_corexy/limit_errors.hpp"
#include "limited_corexy/limited_corexy_node.hpp"

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  int rc = 0;
  try {
    auto node = std::make_shared<limited_corexy::LimitedCoreXYNode>();
    rclcpp::spin(node);
  } catch (const limited_corexy::ConfigError & e) {
    RCLCPP_FATAL(rclcpp::get_logger("limited_corexy_node"), "Invalid configuration: %s", e.what());
    rc = 1;
  }

  rclcpp::shutdown();
  return rc;
}
