// Ticket: 0001_cut_orchestrator

#ifndef CUT_SIM_TEST_HELPERS_TEST_MODELS_HPP
#define CUT_SIM_TEST_HELPERS_TEST_MODELS_HPP

#include <Eigen/Dense>

#include <memory>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Kinematics/RobotLayout.hpp"
#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"

namespace cut_sim::test
{

/// Layout with every binding disabled
RobotLayout emptyLayout();

/**
 * @brief Two-link planar arm on a fixed base plus a passive slider
 *
 * Positions: joint_1 (0), joint_2 (1), slider_joint (2). Links are 0.4 m
 * long; frame "tip" sits at the end of link_2.
 */
std::shared_ptr<const KinematicModel> makePlanarArm();

/// Planner configuration driving joint_1 and joint_2 with "tip" as end effector
TrajectoryPlanner::Config planarArmPlannerConfig();

/**
 * @brief Cuttable floating boxes box_0, box_1, ... with half extents
 * (0.06, 0.03, 0.03) and mass 0.4 kg
 */
std::shared_ptr<const KinematicModel> makeBoxModel(size_t boxCount);

/**
 * @brief State of a box model at rest with box i centered at centers[i]
 */
StateVector boxState(const KinematicModel& model,
                     const std::vector<Eigen::Vector3d>& centers);

}  // namespace cut_sim::test

#endif  // CUT_SIM_TEST_HELPERS_TEST_MODELS_HPP
