// Ticket: 0003_trajectory_planner

#include "cut-sim/src/Trajectory/PchipTrajectory.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cut_sim
{

namespace
{

int sign(double value)
{
  return (value > 0.0) - (value < 0.0);
}

// Three-point one-sided end slope, limited so the end interval stays monotone
double endSlope(double h0, double h1, double del0, double del1)
{
  double d = ((2.0 * h0 + h1) * del0 - h0 * del1) / (h0 + h1);
  if (sign(d) != sign(del0))
  {
    d = 0.0;
  }
  else if (sign(del0) != sign(del1) && std::abs(d) > std::abs(3.0 * del0))
  {
    d = 3.0 * del0;
  }
  return d;
}

}  // namespace

PchipTrajectory::PchipTrajectory(std::vector<double> breaks,
                                 Eigen::MatrixXd samples,
                                 bool zeroEndPointDerivatives)
  : breaks_{std::move(breaks)}, samples_{std::move(samples)}
{
  if (breaks_.size() < 2)
  {
    throw std::invalid_argument("PchipTrajectory: need at least two breaks");
  }
  if (static_cast<size_t>(samples_.cols()) != breaks_.size())
  {
    throw std::invalid_argument(
      "PchipTrajectory: sample columns must match break count");
  }
  for (size_t k = 1; k < breaks_.size(); ++k)
  {
    if (!(breaks_[k] > breaks_[k - 1]))
    {
      throw std::invalid_argument(
        "PchipTrajectory: breaks must be strictly increasing");
    }
  }
  computeSlopes(zeroEndPointDerivatives);
}

void PchipTrajectory::computeSlopes(bool zeroEndPointDerivatives)
{
  const auto n = static_cast<Eigen::Index>(breaks_.size());
  const Eigen::Index rows = samples_.rows();
  slopes_ = Eigen::MatrixXd::Zero(rows, n);

  std::vector<double> h(static_cast<size_t>(n - 1));
  for (Eigen::Index k = 0; k + 1 < n; ++k)
  {
    h[static_cast<size_t>(k)] =
      breaks_[static_cast<size_t>(k + 1)] - breaks_[static_cast<size_t>(k)];
  }

  for (Eigen::Index r = 0; r < rows; ++r)
  {
    std::vector<double> del(static_cast<size_t>(n - 1));
    for (Eigen::Index k = 0; k + 1 < n; ++k)
    {
      del[static_cast<size_t>(k)] =
        (samples_(r, k + 1) - samples_(r, k)) / h[static_cast<size_t>(k)];
    }

    if (n == 2)
    {
      slopes_(r, 0) = del[0];
      slopes_(r, 1) = del[0];
    }
    else
    {
      // Interior: weighted harmonic mean when the secants agree in sign
      for (Eigen::Index k = 1; k + 1 < n; ++k)
      {
        const double dPrev = del[static_cast<size_t>(k - 1)];
        const double dNext = del[static_cast<size_t>(k)];
        if (dPrev * dNext <= 0.0)
        {
          continue;
        }
        const double hPrev = h[static_cast<size_t>(k - 1)];
        const double hNext = h[static_cast<size_t>(k)];
        const double w1 = 2.0 * hNext + hPrev;
        const double w2 = hNext + 2.0 * hPrev;
        slopes_(r, k) = (w1 + w2) / (w1 / dPrev + w2 / dNext);
      }

      const auto last = static_cast<size_t>(n - 2);
      slopes_(r, 0) = endSlope(h[0], h[1], del[0], del[1]);
      slopes_(r, n - 1) = endSlope(h[last], h[last - 1], del[last], del[last - 1]);
    }

    if (zeroEndPointDerivatives)
    {
      slopes_(r, 0) = 0.0;
      slopes_(r, n - 1) = 0.0;
    }
  }
}

size_t PchipTrajectory::segmentIndex(double t) const
{
  auto it = std::upper_bound(breaks_.begin(), breaks_.end(), t);
  auto index = static_cast<size_t>(std::distance(breaks_.begin(), it));
  if (index == 0)
  {
    return 0;
  }
  return std::min(index - 1, breaks_.size() - 2);
}

Eigen::VectorXd PchipTrajectory::value(double t) const
{
  const double tc = std::clamp(t, startTime(), endTime());
  const size_t k = segmentIndex(tc);
  const double h = breaks_[k + 1] - breaks_[k];
  const double s = (tc - breaks_[k]) / h;
  const double s2 = s * s;
  const double s3 = s2 * s;

  const double h00 = 2.0 * s3 - 3.0 * s2 + 1.0;
  const double h10 = s3 - 2.0 * s2 + s;
  const double h01 = -2.0 * s3 + 3.0 * s2;
  const double h11 = s3 - s2;

  const auto c = static_cast<Eigen::Index>(k);
  return h00 * samples_.col(c) + h10 * h * slopes_.col(c) +
         h01 * samples_.col(c + 1) + h11 * h * slopes_.col(c + 1);
}

Eigen::VectorXd PchipTrajectory::derivative(double t) const
{
  if (t < startTime() || t > endTime())
  {
    return Eigen::VectorXd::Zero(rows());
  }
  const size_t k = segmentIndex(t);
  const double h = breaks_[k + 1] - breaks_[k];
  const double s = (t - breaks_[k]) / h;
  const double s2 = s * s;

  const double dh00 = 6.0 * s2 - 6.0 * s;
  const double dh10 = 3.0 * s2 - 4.0 * s + 1.0;
  const double dh01 = -6.0 * s2 + 6.0 * s;
  const double dh11 = 3.0 * s2 - 2.0 * s;

  const auto c = static_cast<Eigen::Index>(k);
  return (dh00 * samples_.col(c) + dh01 * samples_.col(c + 1)) / h +
         dh10 * slopes_.col(c) + dh11 * slopes_.col(c + 1);
}

PchipTrajectory PchipTrajectory::shifted(double offset) const
{
  PchipTrajectory result;
  result.breaks_ = breaks_;
  for (auto& b : result.breaks_)
  {
    b += offset;
  }
  result.samples_ = samples_;
  result.slopes_ = slopes_;
  return result;
}

}  // namespace cut_sim
