#include <gtest/gtest.h>

#include <cmath>
#include <optional>

#include "limited_corexy/axis_limit_store.hpp"
#include "limited_corexy/move.hpp"
#include "limited_corexy/move_limit_evaluator.hpp"

using limited_corexy::AxisLimits;
using limited_corexy::MoveDescriptor;
using limited_corexy::MoveLimitEvaluator;
using limited_corexy::ToolheadLimits;

namespace
{

MoveDescriptor make_move(double x, double y, double z)
{
  MoveDescriptor m;
  m.axes_d = {x, y, z, 0.0};
  m.end_pos = {x, y, z, 0.0};
  m.move_d = std::sqrt(x * x + y * y + z * z);
  m.is_kinematic_move = true;
  return m;
}

AxisLimits make_limits(double config, double ax, double ay, double az, bool scale)
{
  AxisLimits l;
  l.config_max_accel = config;
  l.max_x_accel = ax;
  l.max_y_accel = ay;
  l.max_z_accel = az;
  l.scale_per_axis = scale;
  return l;
}

ToolheadLimits make_toolhead(double v, double a, double zv)
{
  ToolheadLimits t;
  t.max_velocity = v;
  t.max_accel = a;
  t.max_z_velocity = zv;
  return t;
}

}  // namespace

TEST(MoveLimitEvaluator, PureXIndependentPolicyPassesAxisLimitThrough)
{
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(100.0, 0.0, 0.0),
    make_limits(9000.0, 9000.0, 4000.0, 100.0, false),
    make_toolhead(300.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_accel, 9000.0);
  EXPECT_DOUBLE_EQ(r->max_cross_accel, 4000.0);
  // Both belts travel the full 100 mm.
  EXPECT_DOUBLE_EQ(r->max_velocity, 300.0);
}

TEST(MoveLimitEvaluator, PureXScalingPolicyScalesByRequestedOverConfig)
{
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(100.0, 0.0, 0.0),
    make_limits(9000.0, 9000.0, 4000.0, 100.0, true),
    make_toolhead(300.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_accel, 3000.0);
}

TEST(MoveLimitEvaluator, PureYUsesYLimit)
{
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(0.0, -50.0, 0.0),
    make_limits(9000.0, 9000.0, 4000.0, 100.0, false),
    make_toolhead(300.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_accel, 4000.0);
  EXPECT_DOUBLE_EQ(r->max_cross_accel, 9000.0);
}

TEST(MoveLimitEvaluator, DiagonalMoveLoadsOneBeltOnly)
{
  // x == y: only the A belt moves, 2x the Cartesian component each way.
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(10.0, 10.0, 0.0),
    make_limits(9000.0, 9000.0, 4000.0, 100.0, false),
    make_toolhead(300.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  const double move_d = std::sqrt(200.0);
  EXPECT_NEAR(r->max_velocity, 300.0 * move_d / 20.0, 1e-9);
  EXPECT_NEAR(r->max_accel, move_d / (10.0 / 9000.0 + 10.0 / 4000.0), 1e-9);
  EXPECT_NEAR(r->max_accel, r->max_cross_accel, 1e-9);
}

TEST(MoveLimitEvaluator, GeneralDirectionMatchesClosedForm)
{
  const double x = 30.0;
  const double y = -40.0;
  const double ax = 8000.0;
  const double ay = 5000.0;

  const auto r = MoveLimitEvaluator::evaluate(
    make_move(x, y, 0.0),
    make_limits(8000.0, ax, ay, 100.0, false),
    make_toolhead(250.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  const double move_d = 50.0;
  EXPECT_NEAR(r->max_velocity, 250.0 * move_d / 70.0, 1e-9);
  EXPECT_NEAR(r->max_accel, move_d / (std::abs(x) / ax + std::abs(y) / ay), 1e-9);
  EXPECT_NEAR(r->max_cross_accel, move_d / (std::abs(x) / ay + std::abs(y) / ax), 1e-9);
}

TEST(MoveLimitEvaluator, PureZSkipsXYStepAndAppliesZClamp)
{
  const auto toolhead = make_toolhead(300.0, 3000.0, 15.0);
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(0.0, 0.0, 50.0),
    make_limits(9000.0, 9000.0, 4000.0, 250.0, false),
    toolhead);

  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_velocity, std::min(toolhead.max_velocity, toolhead.max_z_velocity));
  EXPECT_DOUBLE_EQ(r->max_accel, std::min(toolhead.max_accel, 250.0));
  // Cross bound is not touched by Z.
  EXPECT_DOUBLE_EQ(r->max_cross_accel, toolhead.max_accel);
}

TEST(MoveLimitEvaluator, PureZWithLooseZLimitsKeepsToolheadCaps)
{
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(0.0, 0.0, -5.0),
    make_limits(9000.0, 9000.0, 4000.0, 9000.0, true),
    make_toolhead(20.0, 1000.0, 40.0));

  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_velocity, 20.0);
  EXPECT_DOUBLE_EQ(r->max_accel, 1000.0);
  EXPECT_DOUBLE_EQ(r->max_cross_accel, 1000.0);
}

TEST(MoveLimitEvaluator, MixedXZTakesTheTighterBound)
{
  // 3-4-5 triangle in x/z: z_ratio = 5/4.
  const auto r = MoveLimitEvaluator::evaluate(
    make_move(3.0, 0.0, 4.0),
    make_limits(9000.0, 9000.0, 4000.0, 100.0, false),
    make_toolhead(300.0, 3000.0, 10.0));

  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(r->max_velocity, 10.0 * 5.0 / 4.0, 1e-9);
  EXPECT_NEAR(r->max_accel, 100.0 * 5.0 / 4.0, 1e-9);
  EXPECT_NEAR(r->max_cross_accel, 5.0 / (3.0 / 4000.0), 1e-9);
}

TEST(MoveLimitEvaluator, ExtrudeOnlyMoveHasNoCaps)
{
  MoveDescriptor m;
  m.axes_d = {0.0, 0.0, 0.0, 5.0};
  m.move_d = 5.0;
  m.is_kinematic_move = false;

  const auto r = MoveLimitEvaluator::evaluate(
    m, make_limits(9000.0, 9000.0, 4000.0, 100.0, false), make_toolhead(300.0, 3000.0, 10.0));
  EXPECT_FALSE(r.has_value());
}

TEST(MoveLimitEvaluator, TinyXYComponentsStayFiniteAndPositive)
{
  // Any nonzero XY component must give a strictly positive, finite divisor,
  // including subnormal components whose ratio to a ceiling underflows.
  const double tiny = 1e-300;
  const double sub = 1e-320;
  const double cases[][3] = {
    {tiny, 0.0, 1.0}, {0.0, tiny, 1.0}, {tiny, tiny, 1.0}, {tiny, -tiny, 1.0},
    {-tiny, 0.0, 1.0}, {1e-12, 1.0, 1.0},
    {sub, 0.0, 1.0}, {0.0, -sub, 1.0}, {sub, sub, 0.0}, {sub, 0.0, 0.0}, {-sub, sub, 0.0}};

  for (const auto & c : cases) {
    MoveDescriptor m = make_move(c[0], c[1], c[2]);
    // hypot keeps the length of a subnormal-only move nonzero.
    m.move_d = std::hypot(c[0], c[1], c[2]);

    const auto r = MoveLimitEvaluator::evaluate(
      m, make_limits(9000.0, 9000.0, 4000.0, 100.0, false), make_toolhead(300.0, 3000.0, 10.0));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(std::isfinite(r->max_velocity)) << c[0] << " " << c[1] << " " << c[2];
    EXPECT_TRUE(std::isfinite(r->max_cross_accel)) << c[0] << " " << c[1] << " " << c[2];
    EXPECT_TRUE(std::isfinite(r->max_accel)) << c[0] << " " << c[1] << " " << c[2];
    EXPECT_GT(r->max_velocity, 0.0);
    EXPECT_GT(r->max_accel, 0.0);
    EXPECT_GT(r->max_cross_accel, 0.0);
  }
}

TEST(MoveLimitEvaluator, SubnormalPureXMoveKeepsAxisCaps)
{
  // Scale-free: a subnormal X-only move is capped exactly like a long one.
  const double sub = 1e-320;
  MoveDescriptor m = make_move(sub, 0.0, 0.0);
  m.move_d = sub;

  const auto r = MoveLimitEvaluator::evaluate(
    m, make_limits(9000.0, 9000.0, 4000.0, 100.0, false), make_toolhead(300.0, 3000.0, 10.0));
  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->max_velocity, 300.0);
  EXPECT_DOUBLE_EQ(r->max_accel, 9000.0);
  EXPECT_DOUBLE_EQ(r->max_cross_accel, 4000.0);
}

TEST(MoveLimitEvaluator, AccelIsLowestOnTheDiagonalDirection)
{
  // Unit moves around the circle: the lowest cap equals the diagonal minimum.
  const auto limits = make_limits(9000.0, 9000.0, 4000.0, 100.0, false);
  const auto toolhead = make_toolhead(300.0, 3000.0, 10.0);

  double lowest = 1e300;
  for (int deg = 0; deg < 360; ++deg) {
    const double rad = deg * 3.14159265358979323846 / 180.0;
    const auto r = MoveLimitEvaluator::evaluate(
      make_move(std::cos(rad), std::sin(rad), 0.0), limits, toolhead);
    ASSERT_TRUE(r.has_value());
    lowest = std::min(lowest, r->max_accel);
  }

  const double diag = limited_corexy::AxisLimitStore::diagonal_minimum_accel(limits).min_accel;
  EXPECT_NEAR(lowest, diag, diag * 1e-3);
  EXPECT_GE(lowest, diag - 1e-6);
}
