// Ticket: 0006_rigid_body_plant

#include "cut-sim/src/Physics/JointController.hpp"

#include <algorithm>
#include <stdexcept>

namespace cut_sim
{

JointController::JointController(const KinematicModel& model,
                                 const std::vector<std::string>& joints,
                                 Gains gains)
  : gains_{gains}
{
  indices_.reserve(joints.size());
  for (const auto& joint : joints)
  {
    indices_.push_back(model.jointPositionIndex(joint));
  }
}

void JointController::apply(const Eigen::VectorXd& q,
                            const Eigen::VectorXd& v,
                            const Eigen::VectorXd& desiredPosition,
                            const Eigen::VectorXd& desiredVelocity,
                            Eigen::VectorXd& effort) const
{
  const auto count = static_cast<Eigen::Index>(indices_.size());
  if (desiredPosition.size() != count ||
      (desiredVelocity.size() != 0 && desiredVelocity.size() != count))
  {
    throw std::invalid_argument("JointController: setpoint size mismatch");
  }

  for (Eigen::Index i = 0; i < count; ++i)
  {
    const Eigen::Index j = indices_[static_cast<size_t>(i)];
    const double vd = desiredVelocity.size() == 0 ? 0.0 : desiredVelocity[i];
    const double u =
      gains_.kp * (desiredPosition[i] - q[j]) + gains_.kd * (vd - v[j]);
    effort[j] += std::clamp(u, -gains_.effortLimit, gains_.effortLimit);
  }
}

}  // namespace cut_sim
