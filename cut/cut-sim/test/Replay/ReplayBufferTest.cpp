// Ticket: 0007_replay_buffer

#include "cut-sim/src/Replay/ReplayBuffer.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>

#include "cut-sim/test/Helpers/TestModels.hpp"

namespace cut_sim
{

namespace
{

/// Constant-velocity log of every state entry from @p from to @p to
SampledTrajectory ramp(const KinematicModel& model, double t0, double t1, double from, double to)
{
  Eigen::MatrixXd samples(model.stateSize(), 2);
  samples.col(0).setConstant(from);
  samples.col(1).setConstant(to);
  return SampledTrajectory{{t0, t1}, samples};
}

}  // namespace

TEST(ReplayBufferTest, ContiguousSegmentsTileTheRun)
{
  auto one = test::makeBoxModel(1);
  auto two = test::makeBoxModel(2);
  ReplayBuffer buffer;

  buffer.append(one, ramp(*one, 0.0, 1.0, 0.0, 1.0));
  buffer.append(two, ramp(*two, 1.0, 3.0, 5.0, 7.0));

  EXPECT_EQ(buffer.size(), 2u);
  EXPECT_TRUE(buffer.isContiguous());
  EXPECT_DOUBLE_EQ(buffer.startTime(), 0.0);
  EXPECT_DOUBLE_EQ(buffer.endTime(), 3.0);
  EXPECT_EQ(buffer.segments()[1].model, two);
  EXPECT_FALSE(buffer.segments()[0].effort.has_value());
}

TEST(ReplayBufferTest, SampleUsesTheCoveringSegment)
{
  auto one = test::makeBoxModel(1);
  auto two = test::makeBoxModel(2);
  ReplayBuffer buffer;
  buffer.append(one, ramp(*one, 0.0, 1.0, 0.0, 1.0));
  buffer.append(two, ramp(*two, 1.0, 3.0, 5.0, 7.0));

  const ReplaySample early = buffer.sample(0.5);
  EXPECT_EQ(early.model, one);
  EXPECT_EQ(early.state.size(), one->stateSize());
  EXPECT_DOUBLE_EQ(early.state[0], 0.5);

  // The later segment owns the handoff instant
  const ReplaySample handoff = buffer.sample(1.0);
  EXPECT_EQ(handoff.model, two);
  EXPECT_DOUBLE_EQ(handoff.state[0], 5.0);

  EXPECT_DOUBLE_EQ(buffer.sample(2.0).state[3], 6.0);
  EXPECT_THROW(static_cast<void>(buffer.sample(3.5)), std::out_of_range);
  EXPECT_THROW(static_cast<void>(buffer.segmentAt(-0.1)), std::out_of_range);
}

TEST(ReplayBufferTest, RejectsGapsAndMismatchedSegments)
{
  auto one = test::makeBoxModel(1);
  ReplayBuffer buffer;
  buffer.append(one, ramp(*one, 0.0, 1.0, 0.0, 1.0));

  EXPECT_THROW(buffer.append(one, ramp(*one, 1.1, 2.0, 0.0, 1.0)), std::invalid_argument);
  EXPECT_THROW(buffer.append(one, ramp(*one, 0.9, 2.0, 0.0, 1.0)), std::invalid_argument);
  EXPECT_THROW(buffer.append(nullptr, ramp(*one, 1.0, 2.0, 0.0, 1.0)), std::invalid_argument);

  auto two = test::makeBoxModel(2);
  EXPECT_THROW(buffer.append(two, ramp(*one, 1.0, 2.0, 0.0, 1.0)), std::invalid_argument);
  EXPECT_EQ(buffer.size(), 1u);
}

TEST(ReplayBufferTest, KeepsEffortAlongsideState)
{
  auto one = test::makeBoxModel(1);
  ReplayBuffer buffer;
  Eigen::MatrixXd effort(2, 2);
  effort << 1.0, 2.0,
            3.0, 4.0;

  buffer.append(one, ramp(*one, 0.0, 1.0, 0.0, 1.0), SampledTrajectory{{0.0, 1.0}, effort});

  ASSERT_TRUE(buffer.segments().front().effort.has_value());
  EXPECT_EQ(buffer.segments().front().effort->rows(), 2);
}

TEST(ReplayBufferTest, EmptyBufferHasNoSpan)
{
  ReplayBuffer buffer;

  EXPECT_TRUE(buffer.empty());
  EXPECT_TRUE(buffer.isContiguous());
  EXPECT_THROW(static_cast<void>(buffer.startTime()), std::out_of_range);
  EXPECT_THROW(static_cast<void>(buffer.sample(0.0)), std::out_of_range);
}

}  // namespace cut_sim
