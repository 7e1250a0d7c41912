// Ticket: 0006_rigid_body_plant

#include "cut-sim/src/Physics/SampleLogger.hpp"

#include <stdexcept>
#include <utility>

namespace cut_sim
{

namespace
{
constexpr double kTimeEpsilon = 1e-12;
}

SampleLogger::SampleLogger(double rate)
  : period_{rate > 0.0 ? 1.0 / rate : 0.0}
{
  if (!(rate > 0.0))
  {
    throw std::invalid_argument("SampleLogger: rate must be positive");
  }
}

void SampleLogger::record(double t, const Eigen::VectorXd& value)
{
  if (!times_.empty() && t < nextSampleTime_ - kTimeEpsilon)
  {
    return;
  }
  forceRecord(t, value);
}

void SampleLogger::forceRecord(double t, const Eigen::VectorXd& value)
{
  if (!times_.empty() && t <= times_.back() + kTimeEpsilon)
  {
    times_.back() = t;
    values_.back() = value;
    return;
  }
  times_.push_back(t);
  values_.push_back(value);
  nextSampleTime_ = t + period_;
}

SampledTrajectory SampleLogger::trajectory() const
{
  if (times_.empty())
  {
    throw std::invalid_argument("SampleLogger: no samples recorded");
  }
  Eigen::MatrixXd samples(values_.front().size(),
                          static_cast<Eigen::Index>(values_.size()));
  for (size_t i = 0; i < values_.size(); ++i)
  {
    samples.col(static_cast<Eigen::Index>(i)) = values_[i];
  }
  return SampledTrajectory{times_, std::move(samples)};
}

}  // namespace cut_sim
