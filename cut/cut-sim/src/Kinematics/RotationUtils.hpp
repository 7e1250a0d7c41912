// Ticket: 0002_kinematic_model

#ifndef CUT_SIM_KINEMATICS_ROTATION_UTILS_HPP
#define CUT_SIM_KINEMATICS_ROTATION_UTILS_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace cut_sim
{

/**
 * @brief Rotation from roll/pitch/yaw, R = Rz(yaw) * Ry(pitch) * Rx(roll)
 */
[[nodiscard]] Eigen::Matrix3d rpyToRotation(const Eigen::Vector3d& rpy);

/**
 * @brief Inverse of rpyToRotation()
 *
 * Pitch is returned in [-pi/2, pi/2]. Near gimbal lock roll and yaw are not
 * unique; the returned pair still reproduces the rotation.
 */
[[nodiscard]] Eigen::Vector3d rotationToRpy(const Eigen::Matrix3d& rotation);

/**
 * @brief Matrix E mapping roll/pitch/yaw rates to world angular velocity,
 * omega = E(rpy) * rpyDot
 */
[[nodiscard]] Eigen::Matrix3d rpyRateToAngularVelocity(const Eigen::Vector3d& rpy);

/// Wrap an angle to [-pi, pi)
[[nodiscard]] double wrapAngle(double angle);

/// Component-wise wrapAngle()
[[nodiscard]] Eigen::Vector3d wrapAngles(const Eigen::Vector3d& angles);

}  // namespace cut_sim

#endif  // CUT_SIM_KINEMATICS_ROTATION_UTILS_HPP
