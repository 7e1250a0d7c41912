// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_DATA_TYPES_END_EFFECTOR_POSE_HPP
#define CUT_SIM_DATA_TYPES_END_EFFECTOR_POSE_HPP

#include <Eigen/Dense>

namespace cut_sim
{

/**
 * @brief World-frame target for a named frame: position plus roll/pitch/yaw
 *
 * Euler convention matches rpyToRotation(): R = Rz(yaw) * Ry(pitch) *
 * Rx(roll).
 */
struct EndEffectorPose
{
  Eigen::Vector3d position{Eigen::Vector3d::Zero()};
  Eigen::Vector3d rpy{Eigen::Vector3d::Zero()};

  /**
   * @brief Component-wise linear interpolation
   * @param from Pose at s = 0
   * @param to Pose at s = 1
   * @param s Interpolation factor, not clamped
   */
  [[nodiscard]] static EndEffectorPose lerp(const EndEffectorPose& from,
                                            const EndEffectorPose& to,
                                            double s)
  {
    return EndEffectorPose{(1.0 - s) * from.position + s * to.position,
                           (1.0 - s) * from.rpy + s * to.rpy};
  }
};

}  // namespace cut_sim

#endif  // CUT_SIM_DATA_TYPES_END_EFFECTOR_POSE_HPP
