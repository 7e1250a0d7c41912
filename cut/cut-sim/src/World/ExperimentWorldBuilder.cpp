// Ticket: 0009_experiment_world

#include "cut-sim/src/World/ExperimentWorldBuilder.hpp"

#include <array>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace cut_sim
{

namespace
{

// Link-to-link offsets along the parent z axis [m]
constexpr std::array<double, 7> kLinkOffsets{
  0.1575, 0.2025, 0.2045, 0.2155, 0.1845, 0.2155, 0.081};
constexpr std::array<double, 7> kJointLimits{
  2.96, 2.09, 2.96, 2.09, 2.96, 2.09, 3.05};
constexpr std::array<double, 8> kLinkMasses{
  5.0, 4.0, 4.0, 3.0, 2.7, 1.7, 1.8, 0.3};

constexpr double kFlangeOffset = 0.045;     // link 7 to gripper center [m]
constexpr double kFingerOffset = 0.055;     // gripper center to finger center [m]
constexpr double kFingerTravel = 0.055;     // [m]
constexpr double kEndEffectorOffset = 0.075;  // gripper center to grasp point [m]

Eigen::Isometry3d translation(double x, double y, double z)
{
  Eigen::Isometry3d transform = Eigen::Isometry3d::Identity();
  transform.translation() = Eigen::Vector3d{x, y, z};
  return transform;
}

Eigen::Vector3d armAxis(size_t joint)
{
  switch (joint)
  {
    case 1:
    case 5:
      return Eigen::Vector3d::UnitY();
    case 3:
      return -Eigen::Vector3d::UnitY();
    default:
      return Eigen::Vector3d::UnitZ();
  }
}

}  // namespace

ExperimentWorldBuilder::ExperimentWorldBuilder(std::uint32_t seed)
  : ExperimentWorldBuilder{seed, Config{}}
{
}

ExperimentWorldBuilder::ExperimentWorldBuilder(std::uint32_t seed, Config config)
  : config_{std::move(config)}, rng_{seed}
{
}

void ExperimentWorldBuilder::addTable(KinematicModelBuilder& builder) const
{
  Body table;
  table.name = "table";
  table.joint.name = "table_weld";
  table.joint.type = JointType::Fixed;
  table.joint.origin = translation(0.6, 0.0, kTableHeight / 2.0);
  table.halfExtents = Eigen::Vector3d{0.3, 0.4, kTableHeight / 2.0};
  builder.addBody(std::move(table));
}

void ExperimentWorldBuilder::addArm(KinematicModelBuilder& builder) const
{
  const RobotLayout& layout = config_.layout;
  if (layout.armJoints.size() != kLinkOffsets.size())
  {
    throw std::invalid_argument("ExperimentWorldBuilder: the arm has " +
                                std::to_string(kLinkOffsets.size()) + " joints");
  }

  Body base;
  base.name = "iiwa_link_0";
  base.joint.name = "iiwa_base_weld";
  base.mass = kLinkMasses[0];
  base.halfExtents = Eigen::Vector3d{0.08, 0.08, 0.05};
  auto parent = static_cast<int>(builder.addBody(std::move(base)));

  for (size_t j = 0; j < kLinkOffsets.size(); ++j)
  {
    Body link;
    link.name = "iiwa_link_" + std::to_string(j + 1);
    link.parent = parent;
    link.joint.name = layout.armJoints[j];
    link.joint.type = JointType::Revolute;
    link.joint.axis = armAxis(j);
    link.joint.origin = translation(0.0, 0.0, kLinkOffsets[j]);
    link.joint.lowerLimit = -kJointLimits[j];
    link.joint.upperLimit = kJointLimits[j];
    link.mass = kLinkMasses[j + 1];
    link.halfExtents = Eigen::Vector3d::Constant(0.05);
    parent = static_cast<int>(builder.addBody(std::move(link)));
  }

  Body gripper;
  gripper.name = "gripper";
  gripper.parent = parent;
  gripper.joint.name = "gripper_weld";
  gripper.joint.origin = translation(0.0, 0.0, kFlangeOffset);
  gripper.mass = 0.5;
  gripper.halfExtents = Eigen::Vector3d{0.025, 0.075, 0.02};
  const size_t gripperIndex = builder.addBody(std::move(gripper));

  auto finger = [&](const std::string& name,
                    const std::string& jointName,
                    const Eigen::Vector3d& axis)
  {
    Body body;
    body.name = name;
    body.parent = static_cast<int>(gripperIndex);
    body.joint.name = jointName;
    body.joint.type = JointType::Prismatic;
    body.joint.axis = axis;
    body.joint.origin = translation(0.0, 0.0, kFingerOffset);
    body.joint.lowerLimit = 0.0;
    body.joint.upperLimit = kFingerTravel;
    body.mass = 0.05;
    body.halfExtents = Eigen::Vector3d{0.01, 0.005, 0.035};
    builder.addBody(std::move(body));
  };
  finger("left_finger", layout.leftFingerJoint, Eigen::Vector3d::UnitY());
  finger("right_finger", layout.rightFingerJoint, -Eigen::Vector3d::UnitY());

  // Grasp point between the finger tips, x axis flipped so that the arm's
  // downward home posture reads as roll = pi
  Frame endEffector;
  endEffector.name = layout.endEffectorFrame;
  endEffector.body = gripperIndex;
  endEffector.offset = translation(0.0, 0.0, kEndEffectorOffset);
  endEffector.offset.linear() =
    Eigen::AngleAxisd{std::numbers::pi, Eigen::Vector3d::UnitZ()}.toRotationMatrix();
  builder.addFrame(std::move(endEffector));
}

void ExperimentWorldBuilder::addKnife(KinematicModelBuilder& builder) const
{
  Body knife;
  knife.name = config_.layout.bladeBody;
  knife.joint.name = config_.layout.knifeJoint;
  knife.joint.type = JointType::Prismatic;
  knife.joint.axis = Eigen::Vector3d::UnitZ();
  knife.joint.origin = translation(0.1, 0.55, 0.55);
  knife.joint.lowerLimit = -0.2;
  knife.joint.upperLimit = 0.0;
  knife.mass = 0.5;
  knife.halfExtents = Eigen::Vector3d{0.002, 0.06, 0.05};
  builder.addBody(std::move(knife));
}

std::vector<Eigen::Vector3d> ExperimentWorldBuilder::sampleObjectPlacements()
{
  std::uniform_real_distribution<double> xDist{config_.objectXRange.x(),
                                               config_.objectXRange.y()};
  std::uniform_real_distribution<double> yDist{config_.objectYRange.x(),
                                               config_.objectYRange.y()};
  std::uniform_real_distribution<double> yawDist{-config_.maxObjectYaw,
                                                 config_.maxObjectYaw};

  std::vector<Eigen::Vector3d> placements;
  placements.reserve(config_.objectCount);
  size_t attempts = 0;
  while (placements.size() < config_.objectCount)
  {
    if (attempts++ >= config_.placementAttempts * (config_.objectCount + 1))
    {
      throw std::runtime_error("ExperimentWorldBuilder: could not place " +
                               std::to_string(config_.objectCount) +
                               " objects on the table");
    }
    const Eigen::Vector3d candidate{xDist(rng_), yDist(rng_), yawDist(rng_)};
    bool clear = true;
    for (const auto& placed : placements)
    {
      if ((placed.head<2>() - candidate.head<2>()).norm() < config_.minObjectSpacing)
      {
        clear = false;
        break;
      }
    }
    if (clear)
    {
      placements.push_back(candidate);
    }
  }
  return placements;
}

ExperimentWorld ExperimentWorldBuilder::build()
{
  if (config_.homePosture.size() != config_.layout.armJoints.size())
  {
    throw std::invalid_argument(
      "ExperimentWorldBuilder: home posture needs one entry per arm joint");
  }

  KinematicModelBuilder builder;
  addTable(builder);
  addArm(builder);
  addKnife(builder);

  ExperimentWorld world;
  const std::vector<Eigen::Vector3d> placements = sampleObjectPlacements();
  for (size_t i = 0; i < placements.size(); ++i)
  {
    Body object;
    object.name = "obj_" + std::to_string(i);
    object.joint.name = object.name + "_floating";
    object.joint.type = JointType::Floating;
    object.mass = config_.objectMass;
    object.halfExtents = config_.objectHalfExtents;
    object.cuttable = true;
    world.objectNames.push_back(object.name);
    builder.addBody(std::move(object));
  }
  world.model = builder.build();

  const KinematicModel& model = *world.model;
  world.initialState = StateVector::Zero(model.stateSize());
  for (size_t j = 0; j < config_.layout.armJoints.size(); ++j)
  {
    world.initialState[model.jointPositionIndex(config_.layout.armJoints[j])] =
      config_.homePosture[j];
  }
  world.initialState[model.jointPositionIndex(config_.layout.leftFingerJoint)] =
    config_.fingerOpening;
  world.initialState[model.jointPositionIndex(config_.layout.rightFingerJoint)] =
    config_.fingerOpening;

  for (size_t i = 0; i < placements.size(); ++i)
  {
    const Eigen::Index start = model.positionStart(model.bodyIndex(world.objectNames[i]));
    world.initialState.segment<3>(start) =
      Eigen::Vector3d{placements[i].x(),
                      placements[i].y(),
                      kTableHeight + config_.objectHalfExtents.z()};
    world.initialState[start + 5] = placements[i].z();
  }
  return world;
}

}  // namespace cut_sim
