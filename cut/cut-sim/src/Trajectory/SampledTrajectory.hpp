// Ticket: 0007_replay_buffer

#ifndef CUT_SIM_TRAJECTORY_SAMPLED_TRAJECTORY_HPP
#define CUT_SIM_TRAJECTORY_SAMPLED_TRAJECTORY_HPP

#include <Eigen/Dense>
#include <vector>

namespace cut_sim
{

/**
 * @brief First-order hold over logged samples
 *
 * Linear interpolation between consecutive samples; before the first or after
 * the last sample the end value is held. A single sample is a constant.
 *
 * @ticket 0007_replay_buffer
 */
class SampledTrajectory
{
public:
  /**
   * @param times Non-decreasing sample times, at least one
   * @param samples One column per sample time
   * @throws std::invalid_argument on size mismatch or decreasing times
   */
  SampledTrajectory(std::vector<double> times, Eigen::MatrixXd samples);

  [[nodiscard]] Eigen::VectorXd value(double t) const;

  [[nodiscard]] double startTime() const
  {
    return times_.front();
  }

  [[nodiscard]] double endTime() const
  {
    return times_.back();
  }

  [[nodiscard]] Eigen::Index rows() const
  {
    return samples_.rows();
  }

  [[nodiscard]] size_t sampleCount() const
  {
    return times_.size();
  }

  [[nodiscard]] const std::vector<double>& times() const
  {
    return times_;
  }

  [[nodiscard]] const Eigen::MatrixXd& samples() const
  {
    return samples_;
  }

  [[nodiscard]] Eigen::VectorXd firstSample() const
  {
    return samples_.col(0);
  }

  [[nodiscard]] Eigen::VectorXd lastSample() const
  {
    return samples_.col(samples_.cols() - 1);
  }

private:
  std::vector<double> times_;
  Eigen::MatrixXd samples_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TRAJECTORY_SAMPLED_TRAJECTORY_HPP
