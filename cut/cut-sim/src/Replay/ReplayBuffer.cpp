// Ticket: 0007_replay_buffer

#include "cut-sim/src/Replay/ReplayBuffer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cut_sim
{

void ReplayBuffer::append(std::shared_ptr<const KinematicModel> model,
                          SampledTrajectory trajectory,
                          std::optional<SampledTrajectory> effort)
{
  if (!model)
  {
    throw std::invalid_argument("ReplayBuffer: segment has no model");
  }
  if (trajectory.rows() != model->stateSize())
  {
    throw std::invalid_argument("ReplayBuffer: trajectory has " +
                                std::to_string(trajectory.rows()) +
                                " rows, model state has " +
                                std::to_string(model->stateSize()));
  }
  if (!segments_.empty() &&
      std::abs(trajectory.startTime() - segments_.back().endTime()) >
        kContinuityTolerance)
  {
    throw std::invalid_argument(
      "ReplayBuffer: segment starts at " + std::to_string(trajectory.startTime()) +
      " but the previous segment ends at " +
      std::to_string(segments_.back().endTime()));
  }

  segments_.push_back(
    SimulationSegment{std::move(model), std::move(trajectory), std::move(effort)});
}

double ReplayBuffer::startTime() const
{
  if (segments_.empty())
  {
    throw std::out_of_range("ReplayBuffer: empty");
  }
  return segments_.front().startTime();
}

double ReplayBuffer::endTime() const
{
  if (segments_.empty())
  {
    throw std::out_of_range("ReplayBuffer: empty");
  }
  return segments_.back().endTime();
}

const SimulationSegment& ReplayBuffer::segmentAt(double t) const
{
  if (segments_.empty() || t < startTime() || t > endTime())
  {
    throw std::out_of_range("ReplayBuffer: time " + std::to_string(t) +
                            " outside the recorded span");
  }
  for (auto it = segments_.rbegin(); it != segments_.rend(); ++it)
  {
    if (t >= it->startTime())
    {
      return *it;
    }
  }
  return segments_.front();
}

ReplaySample ReplayBuffer::sample(double t) const
{
  const SimulationSegment& segment = segmentAt(t);
  return ReplaySample{segment.model, segment.state.value(t)};
}

bool ReplayBuffer::isContiguous(double tolerance) const
{
  for (size_t i = 1; i < segments_.size(); ++i)
  {
    if (std::abs(segments_[i].startTime() - segments_[i - 1].endTime()) > tolerance)
    {
      return false;
    }
  }
  return true;
}

}  // namespace cut_sim
