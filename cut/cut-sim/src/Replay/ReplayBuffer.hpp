// Ticket: 0007_replay_buffer

#ifndef CUT_SIM_REPLAY_REPLAY_BUFFER_HPP
#define CUT_SIM_REPLAY_REPLAY_BUFFER_HPP

#include <memory>
#include <optional>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Trajectory/SampledTrajectory.hpp"

namespace cut_sim
{

/**
 * @brief One continuous span of simulated time on a single topology
 */
struct SimulationSegment
{
  std::shared_ptr<const KinematicModel> model;
  SampledTrajectory state;                  ///< stateSize() rows
  std::optional<SampledTrajectory> effort;  ///< Controlled joint efforts

  [[nodiscard]] double startTime() const
  {
    return state.startTime();
  }

  [[nodiscard]] double endTime() const
  {
    return state.endTime();
  }
};

/// Model and state at one instant of a replay
struct ReplaySample
{
  std::shared_ptr<const KinematicModel> model;
  StateVector state;
};

/**
 * @brief Append-only record of the segments of one run
 *
 * Each appended segment must start where the previous one ended, so the
 * segments tile [startTime(), endTime()] without gaps or overlaps. Segments
 * are never modified after append(). Read only by offline playback.
 *
 * @ticket 0007_replay_buffer
 */
class ReplayBuffer
{
public:
  /// Largest accepted gap or overlap between consecutive segments [s]
  static constexpr double kContinuityTolerance = 1e-9;

  /**
   * @throws std::invalid_argument for a null model, a state trajectory whose
   * row count differs from model->stateSize(), or a start time that does not
   * match the previous segment's end time
   */
  void append(std::shared_ptr<const KinematicModel> model,
              SampledTrajectory trajectory,
              std::optional<SampledTrajectory> effort = std::nullopt);

  [[nodiscard]] const std::vector<SimulationSegment>& segments() const
  {
    return segments_;
  }

  [[nodiscard]] size_t size() const
  {
    return segments_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return segments_.empty();
  }

  /**
   * @throws std::out_of_range if the buffer is empty
   */
  [[nodiscard]] double startTime() const;

  /**
   * @throws std::out_of_range if the buffer is empty
   */
  [[nodiscard]] double endTime() const;

  /**
   * @brief Segment covering time t; at a handoff the later segment
   * @throws std::out_of_range if t lies outside [startTime(), endTime()]
   */
  [[nodiscard]] const SimulationSegment& segmentAt(double t) const;

  /**
   * @brief Interpolated state at t on the segment covering t
   * @throws std::out_of_range if t lies outside [startTime(), endTime()]
   */
  [[nodiscard]] ReplaySample sample(double t) const;

  /// Every consecutive pair of segments meets within @p tolerance
  [[nodiscard]] bool isContiguous(double tolerance = kContinuityTolerance) const;

private:
  std::vector<SimulationSegment> segments_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_REPLAY_REPLAY_BUFFER_HPP
