// Ticket: 0006_rigid_body_plant

#ifndef CUT_SIM_PHYSICS_SAMPLE_LOGGER_HPP
#define CUT_SIM_PHYSICS_SAMPLE_LOGGER_HPP

#include <Eigen/Dense>
#include <vector>

#include "cut-sim/src/Trajectory/SampledTrajectory.hpp"

namespace cut_sim
{

/**
 * @brief Fixed-rate vector logger
 *
 * record() keeps a sample whenever the next sample period has been reached.
 * forceRecord() always keeps the sample, replacing an existing sample taken
 * at the same time, so segment boundaries are always logged exactly.
 */
class SampleLogger
{
public:
  /**
   * @param rate Sample rate [Hz], positive
   * @throws std::invalid_argument for a non-positive rate
   */
  explicit SampleLogger(double rate);

  void record(double t, const Eigen::VectorXd& value);
  void forceRecord(double t, const Eigen::VectorXd& value);

  [[nodiscard]] size_t size() const
  {
    return times_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return times_.empty();
  }

  /**
   * @throws std::invalid_argument if nothing was logged
   */
  [[nodiscard]] SampledTrajectory trajectory() const;

private:
  double period_;
  double nextSampleTime_{0.0};
  std::vector<double> times_;
  std::vector<Eigen::VectorXd> values_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_SAMPLE_LOGGER_HPP
