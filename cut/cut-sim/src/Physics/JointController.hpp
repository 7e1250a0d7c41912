// Ticket: 0006_rigid_body_plant

#ifndef CUT_SIM_PHYSICS_JOINT_CONTROLLER_HPP
#define CUT_SIM_PHYSICS_JOINT_CONTROLLER_HPP

#include <Eigen/Dense>

#include <string>
#include <vector>

#include "cut-sim/src/Kinematics/KinematicModel.hpp"

namespace cut_sim
{

/**
 * @brief Saturated PD control of a group of one-dof joints
 *
 * effort_i = clamp(kp (qd_i - q_i) + kd (vd_i - v_i), -limit, limit)
 *
 * Joints are bound by name at construction, so one controller instance
 * belongs to exactly one model.
 */
class JointController
{
public:
  struct Gains
  {
    double kp{100.0};
    double kd{20.0};
    double effortLimit{100.0};  ///< [N m] or [N]
  };

  /**
   * @throws std::invalid_argument if a joint is unknown or not one-dof
   */
  JointController(const KinematicModel& model,
                  const std::vector<std::string>& joints,
                  Gains gains);

  /**
   * @brief Add this group's efforts into a generalized force vector
   * @param q Generalized positions
   * @param v Generalized velocities
   * @param desiredPosition One entry per controlled joint
   * @param desiredVelocity One entry per joint, or empty for zero
   * @param effort Generalized force vector (velocityCount()), accumulated
   * @throws std::invalid_argument on size mismatch
   */
  void apply(const Eigen::VectorXd& q,
             const Eigen::VectorXd& v,
             const Eigen::VectorXd& desiredPosition,
             const Eigen::VectorXd& desiredVelocity,
             Eigen::VectorXd& effort) const;

  [[nodiscard]] const std::vector<Eigen::Index>& indices() const
  {
    return indices_;
  }

  [[nodiscard]] const Gains& gains() const
  {
    return gains_;
  }

private:
  std::vector<Eigen::Index> indices_;
  Gains gains_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_JOINT_CONTROLLER_HPP
