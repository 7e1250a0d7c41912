// Ticket: 0006_rigid_body_plant

#ifndef CUT_SIM_PHYSICS_RIGID_BODY_PLANT_HPP
#define CUT_SIM_PHYSICS_RIGID_BODY_PLANT_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include <memory>
#include <optional>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Kinematics/RobotLayout.hpp"
#include "cut-sim/src/Physics/CuttingGuard.hpp"

namespace cut_sim
{

/**
 * @brief Penalty-contact dynamics for a model of actuated joints and free boxes
 *
 * One-dof joints are driven as independent second-order systems
 * (inertia * qdd = effort - damping * qd); the arm is assumed gravity
 * compensated. Floating bodies feel gravity and spring-damper contact forces
 * with Coulomb friction at their eight box corners against the ground plane
 * z = 0, every static box and every other floating box.
 *
 * The blade body pushes on cuttable floating bodies wherever sample points
 * along its lower edge are inside them; the reaction acts on the knife joint
 * and each pushed body is reported as a BladeContact.
 *
 * With the fingers closed below graspClosedOpening, the floating body whose
 * center is nearest the end-effector frame (within graspCaptureRadius) is
 * pulled onto that frame by a spring-damper. The arm feels no reaction.
 *
 * Rotation of floating bodies uses world roll/pitch/yaw rates, so the
 * equations are singular at pitch = +-pi/2; the state then turns non-finite
 * and is reported as divergence by the caller.
 *
 * @ticket 0006_rigid_body_plant
 */
class RigidBodyPlant
{
public:
  struct Config
  {
    Eigen::Vector3d gravity{0.0, 0.0, -9.81};  // [m/s^2]
    double jointInertia{0.5};                  // [kg m^2] or [kg]
    double jointDamping{1.0};
    double contactStiffness{2.0e4};            // [N/m]
    double contactDamping{40.0};               // [N s/m]
    double friction{0.6};
    double slipVelocity{1e-3};                 // [m/s] friction regularization
    double angularDamping{1e-3};               // [N m s]
    Eigen::Vector3d bladeDirection{0.0, 0.0, -1.0};
    double bladeStiffness{2.0e4};              // [N/m]
    double bladeDamping{20.0};                 // [N s/m]
    int bladeSamples{7};
    double graspStiffness{2.0e3};              // [N/m]
    double graspDamping{40.0};                 // [N s/m]
    double graspAngularDamping{0.05};          // [N m s]
    double graspCaptureRadius{0.05};           // [m]
    double graspClosedOpening{0.07};           // [m]
  };

  struct Derivatives
  {
    Eigen::VectorXd acceleration;            ///< velocityCount()
    std::vector<BladeContact> bladeContacts;
    std::optional<size_t> graspedBody;
  };

  /**
   * @param model Model the plant is bound to
   * @param layout Joint, body and frame names; empty names disable the
   * matching feature (no blade, no grasp)
   * @param config Physical parameters
   * @throws std::invalid_argument if a non-empty name is missing from the model
   */
  RigidBodyPlant(std::shared_ptr<const KinematicModel> model,
                 const RobotLayout& layout,
                 Config config);

  /**
   * @brief Generalized accelerations under the given joint efforts
   * @param x Full state
   * @param effort Generalized forces, velocityCount() entries
   */
  [[nodiscard]] Derivatives evaluate(const StateVector& x,
                                     const Eigen::VectorXd& effort) const;

  /**
   * @brief Semi-implicit Euler step with joint limit stops
   *
   * v' = v + a dt, q' = q + v' dt; a one-dof joint that leaves its limits is
   * put back on the limit with its outward velocity removed.
   */
  [[nodiscard]] StateVector step(const StateVector& x,
                                 const Eigen::VectorXd& acceleration,
                                 double dt) const;

  [[nodiscard]] const KinematicModel& model() const
  {
    return *model_;
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

  /// Finger gap, or nothing if the model has no fingers
  [[nodiscard]] std::optional<double> gripperOpening(const Eigen::VectorXd& q) const;

private:
  struct Wrench
  {
    Eigen::Vector3d force{Eigen::Vector3d::Zero()};
    Eigen::Vector3d torque{Eigen::Vector3d::Zero()};
  };

  struct BodyKinematics
  {
    Eigen::Vector3d position;
    Eigen::Matrix3d rotation;
    Eigen::Vector3d linearVelocity;
    Eigen::Vector3d angularVelocity;

    [[nodiscard]] Eigen::Vector3d pointVelocity(const Eigen::Vector3d& point) const
    {
      return linearVelocity + angularVelocity.cross(point - position);
    }
  };

  /// Spring-damper normal force plus regularized Coulomb friction
  [[nodiscard]] Eigen::Vector3d contactForce(double depth,
                                             const Eigen::Vector3d& normal,
                                             const Eigen::Vector3d& relativeVelocity) const;

  /// Penetration of a point into a box: depth and outward world normal
  [[nodiscard]] static std::optional<std::pair<double, Eigen::Vector3d>> boxPenetration(
    const Eigen::Vector3d& point,
    const Eigen::Isometry3d& box,
    const Eigen::Vector3d& halfExtents);

  [[nodiscard]] Eigen::Vector3d jointAxisWorld(
    size_t bodyIndex,
    const std::vector<Eigen::Isometry3d>& transforms) const;

  std::shared_ptr<const KinematicModel> model_;
  Config config_;

  std::vector<size_t> floatingBodies_;
  std::vector<size_t> staticBoxes_;
  std::vector<Eigen::Index> oneDofIndices_;
  std::optional<size_t> bladeBody_;
  std::optional<Eigen::Index> leftFinger_;
  std::optional<Eigen::Index> rightFinger_;
  const Frame* endEffector_{nullptr};
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_RIGID_BODY_PLANT_HPP
