// Ticket: 0008_task_state_machine

#include "cut-sim/src/Task/PickAndCutStateMachine.hpp"

#include <algorithm>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

PickAndCutStateMachine::PickAndCutStateMachine(
  std::shared_ptr<const KinematicModel> model,
  std::shared_ptr<const TrajectoryPlanner> planner,
  Config config,
  std::shared_ptr<spdlog::logger> logger,
  TaskProgress progress)
  : model_{std::move(model)},
    planner_{std::move(planner)},
    config_{std::move(config)},
    logger_{std::move(logger)},
    progress_{std::move(progress)}
{
  if (!model_ || !planner_ || !logger_)
  {
    throw std::invalid_argument(
      "PickAndCutStateMachine: model, planner and logger are required");
  }
  if (config_.homePosture.size() != config_.layout.armJoints.size())
  {
    throw std::invalid_argument(
      "PickAndCutStateMachine: home posture must cover every arm joint");
  }
  for (const auto& joint : config_.layout.armJoints)
  {
    armIndices_.push_back(model_->jointPositionIndex(joint));
  }

  if (progress_.activeObject && !model_->findBody(*progress_.activeObject))
  {
    // The active object was cut in the previous segment
    phase_ = Phase::Release;
  }
  else if (!progress_.activeObject)
  {
    selectNextObject();
  }

  logger_->debug("PickAndCutStateMachine: starting in {} (active object: {})",
                 phaseName(phase_),
                 progress_.activeObject.value_or("none"));
}

std::string_view PickAndCutStateMachine::phaseName(Phase phase)
{
  switch (phase)
  {
    case Phase::Approach:
      return "Approach";
    case Phase::Grasp:
      return "Grasp";
    case Phase::Lift:
      return "Lift";
    case Phase::PositionOverBlade:
      return "PositionOverBlade";
    case Phase::Cut:
      return "Cut";
    case Phase::Release:
      return "Release";
    case Phase::Retreat:
      return "Retreat";
    case Phase::Done:
      return "Done";
  }
  return "Unknown";
}

void PickAndCutStateMachine::selectNextObject()
{
  progress_.activeObject.reset();
  for (const auto& body : model_->bodies())
  {
    if (body.cuttable && body.joint.type == JointType::Floating &&
        !progress_.isFinished(lineageRoot(body.name)))
    {
      progress_.activeObject = body.name;
      phase_ = Phase::Approach;
      return;
    }
  }
  phase_ = Phase::Done;
}

PickAndCutStateMachine::Phase PickAndCutStateMachine::nextPhase() const
{
  switch (phase_)
  {
    case Phase::Approach:
      return Phase::Grasp;
    case Phase::Grasp:
      return Phase::Lift;
    case Phase::Lift:
      return Phase::PositionOverBlade;
    case Phase::PositionOverBlade:
      return Phase::Cut;
    case Phase::Cut:
      return Phase::Release;
    case Phase::Release:
      return Phase::Retreat;
    case Phase::Retreat:
    case Phase::Done:
      return Phase::Done;
  }
  return Phase::Done;
}

void PickAndCutStateMachine::update(double t, const StateVector& x)
{
  if (phase_ == Phase::Done)
  {
    return;
  }
  model_->validateState(x);

  if (!entered_)
  {
    enterPhase(t, x);
    return;
  }
  if (t < phaseEnd_)
  {
    return;
  }

  if (phase_ == Phase::Retreat)
  {
    progress_.finishedObjects.push_back(lineageRoot(*progress_.activeObject));
    logger_->info("PickAndCutStateMachine: finished object '{}'",
                  progress_.finishedObjects.back());
    selectNextObject();
    if (phase_ == Phase::Done)
    {
      logger_->info("PickAndCutStateMachine: all objects processed");
      return;
    }
  }
  else
  {
    phase_ = nextPhase();
  }

  if (phase_ == Phase::Lift)
  {
    ++progress_.objectsPicked;
  }
  logger_->debug("PickAndCutStateMachine: t={:.3f} entering {}", t, phaseName(phase_));
  enterPhase(t, x);
}

void PickAndCutStateMachine::enterPhase(double t, const StateVector& x)
{
  const Eigen::VectorXd q = model_->positions(x);
  entered_ = true;
  phaseStart_ = t;
  armPlan_.reset();
  holdPosture_ = armSubset(q);

  switch (phase_)
  {
    case Phase::Approach:
    {
      const Eigen::Isometry3d object = objectPose(q);
      const double yaw = rotationToRpy(object.linear()).z();
      EndEffectorPose grasp{object.translation(),
                            Eigen::Vector3d{std::numbers::pi, 0.0, yaw}};
      EndEffectorPose reach = grasp;
      reach.position.z() += config_.approachHeight;

      auto plan = planner_->planMultiTargetTrajectory(model_,
                                                      q,
                                                      reach,
                                                      grasp,
                                                      config_.approachKnots,
                                                      config_.reachTime,
                                                      config_.graspTime,
                                                      t);
      if (plan.nominal())
      {
        armPlan_ = std::move(plan.value);
      }
      else
      {
        logger_->warn(
          "PickAndCutStateMachine: approach plan status {}, retrying with IK "
          "and a posture move",
          plan.status);
        armPlan_ = planArmTo(grasp, q, t);
      }
      break;
    }
    case Phase::Lift:
    {
      const Eigen::Isometry3d ee =
        model_->framePose(q, config_.layout.endEffectorFrame);
      EndEffectorPose lifted{ee.translation(), rotationToRpy(ee.linear())};
      lifted.position.z() += config_.liftHeight;
      armPlan_ = planArmTo(lifted, q, t);
      break;
    }
    case Phase::PositionOverBlade:
      armPlan_ = planArmTo(overBladePose(q), q, t);
      break;
    case Phase::Retreat:
      armPlan_ = planArmPosture(
        Eigen::Map<const Eigen::VectorXd>(config_.homePosture.data(),
                                          static_cast<Eigen::Index>(
                                            config_.homePosture.size())),
        q,
        t);
      break;
    case Phase::Grasp:
    case Phase::Cut:
    case Phase::Release:
    case Phase::Done:
      break;
  }

  switch (phase_)
  {
    case Phase::Grasp:
      phaseEnd_ = t + config_.graspDuration;
      break;
    case Phase::Cut:
      phaseEnd_ = t + config_.cutDuration;
      break;
    case Phase::Release:
      phaseEnd_ = t + config_.releaseDuration;
      break;
    default:
      phaseEnd_ = armPlan_ ? armPlan_->endTime() : t;
      break;
  }
}

Eigen::VectorXd PickAndCutStateMachine::armSubset(const Eigen::VectorXd& q) const
{
  Eigen::VectorXd arm(static_cast<Eigen::Index>(armIndices_.size()));
  for (size_t i = 0; i < armIndices_.size(); ++i)
  {
    arm[static_cast<Eigen::Index>(i)] = q[armIndices_[i]];
  }
  return arm;
}

Eigen::Isometry3d PickAndCutStateMachine::objectPose(const Eigen::VectorXd& q) const
{
  const size_t index = model_->bodyIndex(*progress_.activeObject);
  return model_->forwardKinematics(q)[index];
}

EndEffectorPose PickAndCutStateMachine::overBladePose(const Eigen::VectorXd& q) const
{
  // Blade geometry with the knife raised
  Eigen::VectorXd raised = q;
  raised[model_->jointPositionIndex(config_.layout.knifeJoint)] = config_.knifeUp;
  const size_t bladeIndex = model_->bodyIndex(config_.layout.bladeBody);
  const Eigen::Isometry3d blade = model_->forwardKinematics(raised)[bladeIndex];
  const Body& bladeBody = model_->body(bladeIndex);

  double objectHalfHeight = 0.0;
  if (progress_.activeObject)
  {
    if (auto index = model_->findBody(*progress_.activeObject))
    {
      objectHalfHeight = model_->body(*index).halfExtents.z();
    }
  }

  EndEffectorPose pose;
  pose.position = blade.translation();
  pose.position.x() -= config_.bladeCutOffset;
  pose.position.z() -= bladeBody.halfExtents.z() + config_.bladeClearance +
                       objectHalfHeight;
  pose.rpy = Eigen::Vector3d{std::numbers::pi, 0.0, 0.0};
  return pose;
}

PchipTrajectory PickAndCutStateMachine::planArmTo(const EndEffectorPose& pose,
                                                  const Eigen::VectorXd& q,
                                                  double t) const
{
  auto ik = planner_->planToEndEffectorPose(model_, q, pose);
  if (!ik.nominal())
  {
    Eigen::VectorXd home = q;
    for (size_t i = 0; i < armIndices_.size(); ++i)
    {
      home[armIndices_[i]] = config_.homePosture[i];
    }
    logger_->warn(
      "PickAndCutStateMachine: IK status {}, retrying from the home posture",
      ik.status);
    auto retry = planner_->planToEndEffectorPose(model_, q, pose, home);
    if (retry.nominal())
    {
      ik = std::move(retry);
    }
    else
    {
      logger_->warn(
        "PickAndCutStateMachine: IK retry status {}, proceeding best-effort",
        retry.status);
    }
  }
  return planArmPosture(armSubset(ik.value), q, t);
}

PchipTrajectory PickAndCutStateMachine::planArmPosture(
  const Eigen::VectorXd& armTarget,
  const Eigen::VectorXd& q,
  double t) const
{
  auto move = planner_->planToPosture(model_,
                                      q,
                                      armTarget,
                                      config_.layout.armJoints,
                                      config_.moveKnots,
                                      config_.moveDuration,
                                      t);
  if (move.nominal())
  {
    return std::move(move.value);
  }

  logger_->warn(
    "PickAndCutStateMachine: posture plan status {}, retrying with {} knots",
    move.status,
    2 * config_.moveKnots);
  auto retry = planner_->planToPosture(model_,
                                       q,
                                       armTarget,
                                       config_.layout.armJoints,
                                       2 * config_.moveKnots,
                                       config_.moveDuration,
                                       t);
  if (!retry.nominal())
  {
    logger_->warn(
      "PickAndCutStateMachine: posture retry status {}, proceeding best-effort",
      retry.status);
  }
  return std::move(retry.value);
}

double PickAndCutStateMachine::phaseFraction(double t, double duration) const
{
  if (duration <= 0.0)
  {
    return 1.0;
  }
  return std::clamp((t - phaseStart_) / duration, 0.0, 1.0);
}

Setpoints PickAndCutStateMachine::setpoints(double t) const
{
  Setpoints result;
  if (armPlan_)
  {
    result.armPosition = armSubset(armPlan_->value(t));
    result.armVelocity = armSubset(armPlan_->derivative(t));
  }
  else if (holdPosture_.size() > 0)
  {
    result.armPosition = holdPosture_;
    result.armVelocity = Eigen::VectorXd::Zero(holdPosture_.size());
  }

  result.knifePosition = config_.knifeUp;
  switch (phase_)
  {
    case Phase::Grasp:
    {
      const double s = phaseFraction(t, config_.graspDuration);
      result.gripperOpening =
        config_.gripperOpen + s * (config_.gripperClosed - config_.gripperOpen);
      break;
    }
    case Phase::Lift:
    case Phase::PositionOverBlade:
      result.gripperOpening = config_.gripperClosed;
      break;
    case Phase::Cut:
    {
      const double s = phaseFraction(t, config_.cutDuration);
      result.gripperOpening = config_.gripperClosed;
      result.knifePosition =
        config_.knifeUp + s * (config_.knifeDown - config_.knifeUp);
      break;
    }
    case Phase::Release:
    {
      const double s = phaseFraction(t, config_.releaseDuration);
      result.gripperOpening =
        config_.gripperClosed + s * (config_.gripperOpen - config_.gripperClosed);
      break;
    }
    case Phase::Approach:
    case Phase::Retreat:
    case Phase::Done:
      result.gripperOpening = config_.gripperOpen;
      break;
  }
  return result;
}

// ========== PickAndCutTaskFactory ==========

PickAndCutTaskFactory::PickAndCutTaskFactory(
  std::shared_ptr<const TrajectoryPlanner> planner,
  PickAndCutStateMachine::Config config,
  std::shared_ptr<spdlog::logger> logger)
  : planner_{std::move(planner)},
    config_{std::move(config)},
    logger_{std::move(logger)}
{
}

std::unique_ptr<TaskStateMachine> PickAndCutTaskFactory::create(
  std::shared_ptr<const KinematicModel> model,
  const TaskProgress& progress)
{
  return std::make_unique<PickAndCutStateMachine>(
    std::move(model), planner_, config_, logger_, progress);
}

}  // namespace cut_sim
