// Ticket: 0009_experiment_world

#ifndef CUT_SIM_WORLD_EXPERIMENT_WORLD_BUILDER_HPP
#define CUT_SIM_WORLD_EXPERIMENT_WORLD_BUILDER_HPP

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Kinematics/RobotLayout.hpp"

namespace cut_sim
{

/**
 * @brief Initial model and state of a pick-and-cut experiment
 */
struct ExperimentWorld
{
  std::shared_ptr<const KinematicModel> model;
  StateVector initialState;
  std::vector<std::string> objectNames;
};

/**
 * @brief Builds the pick-and-cut scene
 *
 * The scene holds a table, a seven-joint arm on a fixed base with a
 * two-finger parallel gripper, a guillotine knife on a vertical prismatic
 * joint beside the table, and @c objectCount cuttable boxes on floating
 * joints at random positions and yaw on the table top. Placement uses a
 * std::mt19937 seeded with the given seed, so equal seeds give equal scenes.
 *
 * Body order: table, arm links, gripper, fingers, knife, objects. Objects
 * are named obj_0, obj_1, ...
 *
 * @ticket 0009_experiment_world
 */
class ExperimentWorldBuilder
{
public:
  struct Config
  {
    RobotLayout layout;
    size_t objectCount{2};
    std::vector<double> homePosture{0.0, 0.6, 0.0, -1.75, 0.0, 1.0, 0.0};
    double fingerOpening{0.05};  // [m] per finger
    Eigen::Vector3d objectHalfExtents{0.06, 0.03, 0.03};  // [m]
    double objectMass{0.43};                               // [kg]
    Eigen::Vector2d objectXRange{0.45, 0.75};              // [m]
    Eigen::Vector2d objectYRange{-0.25, 0.25};             // [m]
    double maxObjectYaw{0.3};                              // [rad]
    double minObjectSpacing{0.15};                         // [m] center to center
    size_t placementAttempts{200};
  };

  static constexpr double kTableHeight = 0.4;  // [m] table top

  explicit ExperimentWorldBuilder(std::uint32_t seed);
  ExperimentWorldBuilder(std::uint32_t seed, Config config);

  /**
   * @throws std::invalid_argument if the home posture does not have one
   * entry per arm joint
   * @throws std::runtime_error if the objects cannot be placed with the
   * requested spacing
   */
  [[nodiscard]] ExperimentWorld build();

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  void addTable(KinematicModelBuilder& builder) const;
  void addArm(KinematicModelBuilder& builder) const;
  void addKnife(KinematicModelBuilder& builder) const;

  /// Planar object poses (x, y, yaw)
  [[nodiscard]] std::vector<Eigen::Vector3d> sampleObjectPlacements();

  Config config_;
  std::mt19937 rng_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_WORLD_EXPERIMENT_WORLD_BUILDER_HPP
