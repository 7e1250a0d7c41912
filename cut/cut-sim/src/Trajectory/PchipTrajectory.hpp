// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_TRAJECTORY_PCHIP_TRAJECTORY_HPP
#define CUT_SIM_TRAJECTORY_PCHIP_TRAJECTORY_HPP

#include <Eigen/Dense>
#include <vector>

namespace cut_sim
{

/**
 * @brief Piecewise cubic Hermite joint trajectory with shape-preserving slopes
 *
 * Slopes follow Fritsch-Carlson: on every interval each coordinate is
 * monotone between its two knot values, so the curve never overshoots the
 * range spanned by neighbouring knots. With zero end-point derivatives the
 * trajectory starts and ends at rest.
 *
 * Outside [startTime(), endTime()] the trajectory holds its end values.
 * Immutable after construction.
 *
 * @ticket 0003_trajectory_planner
 */
class PchipTrajectory
{
public:
  /**
   * @param breaks Strictly increasing knot times, at least two
   * @param samples Knot values, one column per break
   * @param zeroEndPointDerivatives Force zero slope at the first and last knot
   * @throws std::invalid_argument on size mismatch or non-increasing breaks
   */
  PchipTrajectory(std::vector<double> breaks,
                  Eigen::MatrixXd samples,
                  bool zeroEndPointDerivatives);

  [[nodiscard]] Eigen::VectorXd value(double t) const;
  [[nodiscard]] Eigen::VectorXd derivative(double t) const;

  [[nodiscard]] double startTime() const
  {
    return breaks_.front();
  }

  [[nodiscard]] double endTime() const
  {
    return breaks_.back();
  }

  [[nodiscard]] Eigen::Index rows() const
  {
    return samples_.rows();
  }

  [[nodiscard]] const std::vector<double>& breaks() const
  {
    return breaks_;
  }

  [[nodiscard]] const Eigen::MatrixXd& samples() const
  {
    return samples_;
  }

  /// Same curve with every break moved by @p offset
  [[nodiscard]] PchipTrajectory shifted(double offset) const;

private:
  PchipTrajectory() = default;

  void computeSlopes(bool zeroEndPointDerivatives);

  /// Interval containing t (t already clamped to the domain)
  [[nodiscard]] size_t segmentIndex(double t) const;

  std::vector<double> breaks_;
  Eigen::MatrixXd samples_;
  Eigen::MatrixXd slopes_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TRAJECTORY_PCHIP_TRAJECTORY_HPP
