// Ticket: 0002_kinematic_model

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace cut_sim
{

Eigen::Matrix3d rpyToRotation(const Eigen::Vector3d& rpy)
{
  return (Eigen::AngleAxisd{rpy.z(), Eigen::Vector3d::UnitZ()} *
          Eigen::AngleAxisd{rpy.y(), Eigen::Vector3d::UnitY()} *
          Eigen::AngleAxisd{rpy.x(), Eigen::Vector3d::UnitX()})
    .toRotationMatrix();
}

Eigen::Vector3d rotationToRpy(const Eigen::Matrix3d& rotation)
{
  const double sinPitch = std::clamp(-rotation(2, 0), -1.0, 1.0);
  const double pitch = std::asin(sinPitch);

  // Gimbal lock: fold all of the remaining rotation into yaw
  if (std::abs(sinPitch) > 1.0 - 1e-12)
  {
    const double yaw = std::atan2(-rotation(0, 1), rotation(1, 1));
    return Eigen::Vector3d{0.0, pitch, yaw};
  }

  const double roll = std::atan2(rotation(2, 1), rotation(2, 2));
  const double yaw = std::atan2(rotation(1, 0), rotation(0, 0));
  return Eigen::Vector3d{roll, pitch, yaw};
}

Eigen::Matrix3d rpyRateToAngularVelocity(const Eigen::Vector3d& rpy)
{
  const double cp = std::cos(rpy.y());
  const double sp = std::sin(rpy.y());
  const double cy = std::cos(rpy.z());
  const double sy = std::sin(rpy.z());

  Eigen::Matrix3d E;
  E << cy * cp, -sy, 0.0,
       sy * cp,  cy, 0.0,
           -sp, 0.0, 1.0;
  return E;
}

double wrapAngle(double angle)
{
  constexpr double kTwoPi = 2.0 * std::numbers::pi;
  double wrapped = std::fmod(angle + std::numbers::pi, kTwoPi);
  if (wrapped < 0.0)
  {
    wrapped += kTwoPi;
  }
  return wrapped - std::numbers::pi;
}

Eigen::Vector3d wrapAngles(const Eigen::Vector3d& angles)
{
  return Eigen::Vector3d{
    wrapAngle(angles.x()), wrapAngle(angles.y()), wrapAngle(angles.z())};
}

}  // namespace cut_sim
