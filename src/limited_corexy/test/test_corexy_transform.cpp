#include <gtest/gtest.h>

#include "limited_corexy/corexy_transform.hpp"
#include "limited_corexy/limit_errors.hpp"
#include "limited_corexy/move.hpp"

using limited_corexy::CoreXYTransform;
using limited_corexy::MoveDescriptor;
using limited_corexy::MoveError;
using limited_corexy::RangeError;
using limited_corexy::Vector3;

namespace
{
MoveDescriptor move_to(const Vector3 & start, const Vector3 & end)
{
  MoveDescriptor m;
  for (std::size_t i = 0; i < 3; ++i) {
    m.axes_d[i] = end[i] - start[i];
    m.end_pos[i] = end[i];
  }
  m.move_d = 1.0;
  return m;
}
}  // namespace

TEST(CoreXYTransform, MotorAndCartesianPositionsRoundTrip)
{
  CoreXYTransform t;

  const Vector3 motors = t.motor_position(Vector3{30.0, 10.0, 5.0});
  EXPECT_DOUBLE_EQ(motors[0], 40.0);
  EXPECT_DOUBLE_EQ(motors[1], 20.0);
  EXPECT_DOUBLE_EQ(motors[2], 5.0);

  const Vector3 cart = t.calc_position(motors);
  EXPECT_DOUBLE_EQ(cart[0], 30.0);
  EXPECT_DOUBLE_EQ(cart[1], 10.0);
  EXPECT_DOUBLE_EQ(cart[2], 5.0);
}

TEST(CoreXYTransform, AxesStartUnhomed)
{
  CoreXYTransform t;
  EXPECT_FALSE(t.is_homed(0));
  EXPECT_FALSE(t.is_homed(1));
  EXPECT_FALSE(t.is_homed(2));

  EXPECT_THROW(t.check_endstops(move_to({0, 0, 0}, {1, 0, 0})), MoveError);
}

TEST(CoreXYTransform, UnhomedAxisReportsMustHomeFirst)
{
  CoreXYTransform t;
  try {
    t.check_endstops(move_to({0, 0, 0}, {0, 5, 0}));
    FAIL() << "expected MoveError";
  } catch (const MoveError & e) {
    EXPECT_STREQ(e.what(), "Must home axis first");
  }
}

TEST(CoreXYTransform, MoveInsideRangeIsAccepted)
{
  CoreXYTransform t;
  t.set_axis_range(0, 0.0, 200.0);
  t.set_axis_range(1, 0.0, 200.0);

  // Z is unhomed but does not move.
  EXPECT_NO_THROW(t.check_endstops(move_to({10, 10, 0}, {200, 0, 0})));
}

TEST(CoreXYTransform, MoveOutsideRangeIsRejected)
{
  CoreXYTransform t;
  t.set_axis_range(0, 0.0, 200.0);
  t.set_axis_range(1, 0.0, 200.0);
  t.set_axis_range(2, 0.0, 100.0);

  EXPECT_THROW(t.check_endstops(move_to({10, 10, 0}, {200.5, 10, 0})), MoveError);
  EXPECT_THROW(t.check_endstops(move_to({10, 10, 0}, {10, 10, -0.1})), MoveError);
}

TEST(CoreXYTransform, ClearHomingStateForgetsRanges)
{
  CoreXYTransform t;
  t.set_axis_range(0, 0.0, 200.0);
  t.set_axis_range(1, 0.0, 200.0);
  ASSERT_TRUE(t.is_homed(0));

  t.clear_homing_state(0);
  EXPECT_FALSE(t.is_homed(0));
  EXPECT_TRUE(t.is_homed(1));

  t.clear_homing_state();
  EXPECT_FALSE(t.is_homed(1));
}

TEST(CoreXYTransform, InvalidRangeOrAxisIsRejected)
{
  CoreXYTransform t;
  EXPECT_THROW(t.set_axis_range(0, 10.0, 5.0), RangeError);
  EXPECT_THROW(t.set_axis_range(3, 0.0, 5.0), RangeError);
  EXPECT_THROW(t.is_homed(7), RangeError);
}
