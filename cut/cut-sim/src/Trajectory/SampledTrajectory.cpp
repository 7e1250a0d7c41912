// Ticket: 0007_replay_buffer

#include "cut-sim/src/Trajectory/SampledTrajectory.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cut_sim
{

SampledTrajectory::SampledTrajectory(std::vector<double> times,
                                     Eigen::MatrixXd samples)
  : times_{std::move(times)}, samples_{std::move(samples)}
{
  if (times_.empty())
  {
    throw std::invalid_argument("SampledTrajectory: no samples");
  }
  if (static_cast<size_t>(samples_.cols()) != times_.size())
  {
    throw std::invalid_argument(
      "SampledTrajectory: sample columns must match time count");
  }
  if (!std::is_sorted(times_.begin(), times_.end()))
  {
    throw std::invalid_argument("SampledTrajectory: times must be non-decreasing");
  }
}

Eigen::VectorXd SampledTrajectory::value(double t) const
{
  if (t <= times_.front())
  {
    return samples_.col(0);
  }
  if (t >= times_.back())
  {
    return lastSample();
  }

  auto it = std::upper_bound(times_.begin(), times_.end(), t);
  const auto hi = static_cast<Eigen::Index>(std::distance(times_.begin(), it));
  const Eigen::Index lo = hi - 1;
  const double t0 = times_[static_cast<size_t>(lo)];
  const double t1 = times_[static_cast<size_t>(hi)];
  const double s = (t - t0) / (t1 - t0);
  return (1.0 - s) * samples_.col(lo) + s * samples_.col(hi);
}

}  // namespace cut_sim
