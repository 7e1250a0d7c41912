// Ticket: 0006_rigid_body_plant

#include "cut-sim/src/Physics/RigidBodySimulation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace cut_sim
{

namespace
{

constexpr double kTimeEpsilon = 1e-9;

std::optional<JointController> makeController(const KinematicModel& model,
                                              const std::vector<std::string>& joints,
                                              const JointController::Gains& gains)
{
  if (joints.empty())
  {
    return std::nullopt;
  }
  return JointController{model, joints, gains};
}

std::vector<std::string> fingerJoints(const RobotLayout& layout)
{
  if (layout.leftFingerJoint.empty() || layout.rightFingerJoint.empty())
  {
    return {};
  }
  return {layout.leftFingerJoint, layout.rightFingerJoint};
}

std::vector<std::string> knifeJoints(const RobotLayout& layout)
{
  if (layout.knifeJoint.empty())
  {
    return {};
  }
  return {layout.knifeJoint};
}

}  // namespace

RigidBodySimulation::RigidBodySimulation(std::shared_ptr<const KinematicModel> model,
                                         std::unique_ptr<TaskStateMachine> task,
                                         Config config,
                                         std::optional<double> lastCutTime,
                                         TaskProgress progress,
                                         std::shared_ptr<spdlog::logger> logger)
  : model_{std::move(model)},
    task_{std::move(task)},
    config_{std::move(config)},
    initialProgress_{std::move(progress)},
    logger_{std::move(logger)},
    plant_{model_, config_.layout, config_.plant},
    guard_{config_.guard, lastCutTime},
    armController_{makeController(*model_, config_.layout.armJoints, config_.armGains)},
    gripperController_{
      makeController(*model_, fingerJoints(config_.layout), config_.gripperGains)},
    knifeController_{
      makeController(*model_, knifeJoints(config_.layout), config_.knifeGains)},
    stateLogger_{config_.logRate},
    effortLogger_{config_.logRate}
{
  if (!logger_)
  {
    throw std::invalid_argument("RigidBodySimulation: logger must not be null");
  }
  if (!(config_.timestep > 0.0) || !(config_.decisionPeriod > 0.0))
  {
    throw std::invalid_argument(
      "RigidBodySimulation: timestep and decision period must be positive");
  }

  Eigen::Index controlled = 0;
  for (const auto* controller : {&armController_, &gripperController_, &knifeController_})
  {
    if (*controller)
    {
      controlled += static_cast<Eigen::Index>((*controller)->indices().size());
    }
  }
  lastEffort_ = Eigen::VectorXd::Zero(controlled);
}

void RigidBodySimulation::initialize(const StateVector& x, double t)
{
  model_->validateState(x);
  state_ = x;
  time_ = t;
  nextDecision_ = t;
  initialized_ = true;
  lastEffort_.setZero();
  logSample(true);
}

TaskProgress RigidBodySimulation::taskProgress() const
{
  return task_ ? task_->progress() : initialProgress_;
}

void RigidBodySimulation::logSample(bool force)
{
  if (force)
  {
    stateLogger_.forceRecord(time_, state_);
    effortLogger_.forceRecord(time_, lastEffort_);
  }
  else
  {
    stateLogger_.record(time_, state_);
    effortLogger_.record(time_, lastEffort_);
  }
}

Eigen::VectorXd RigidBodySimulation::controlEffort(double t)
{
  Eigen::VectorXd effort = Eigen::VectorXd::Zero(model_->velocityCount());
  if (!task_)
  {
    return effort;
  }

  const Setpoints setpoints = task_->setpoints(t);
  const Eigen::VectorXd q = model_->positions(state_);
  const Eigen::VectorXd v = model_->velocities(state_);

  if (armController_ && setpoints.armPosition)
  {
    armController_->apply(q, v, *setpoints.armPosition, setpoints.armVelocity, effort);
  }
  if (gripperController_)
  {
    const double half = 0.5 * setpoints.gripperOpening;
    gripperController_->apply(
      q, v, Eigen::Vector2d{half, half}, Eigen::VectorXd{}, effort);
  }
  if (knifeController_)
  {
    knifeController_->apply(q,
                            v,
                            Eigen::VectorXd::Constant(1, setpoints.knifePosition),
                            Eigen::VectorXd{},
                            effort);
  }

  Eigen::Index row = 0;
  for (const auto* controller : {&armController_, &gripperController_, &knifeController_})
  {
    if (!*controller)
    {
      continue;
    }
    for (const Eigen::Index j : (*controller)->indices())
    {
      lastEffort_[row++] = effort[j];
    }
  }
  return effort;
}

AdvanceResult RigidBodySimulation::advanceTo(double tEnd)
{
  if (!initialized_)
  {
    throw std::logic_error("RigidBodySimulation: advanceTo() before initialize()");
  }

  while (time_ < tEnd - kTimeEpsilon)
  {
    // ===== Task Decisions =====

    if (task_ && time_ >= nextDecision_ - kTimeEpsilon)
    {
      task_->update(time_, state_);
      nextDecision_ = time_ + config_.decisionPeriod;
      if (task_->isComplete())
      {
        logSample(true);
        logger_->info("RigidBodySimulation: task complete at t={:.4f}", time_);
        return AdvanceResult{AdvanceResult::Kind::TaskComplete, time_, std::nullopt,
                             "task state machine reported completion"};
      }
    }

    // ===== Dynamics =====

    const Eigen::VectorXd effort = controlEffort(time_);
    const RigidBodyPlant::Derivatives derivatives = plant_.evaluate(state_, effort);

    if (auto cut = guard_.check(time_, derivatives.bladeContacts))
    {
      logSample(true);
      logger_->info("RigidBodySimulation: cut of '{}' at t={:.4f}",
                    model_->body(cut->bodyIndex).name,
                    time_);
      return AdvanceResult{
        AdvanceResult::Kind::CutInterrupt, time_, std::move(cut), "blade cut"};
    }

    double next = std::min(time_ + config_.timestep, tEnd);
    if (tEnd - next < kTimeEpsilon)
    {
      next = tEnd;
    }
    StateVector candidate = plant_.step(state_, derivatives.acceleration, next - time_);
    if (!isFinite(candidate))
    {
      logSample(true);
      logger_->warn("RigidBodySimulation: non-finite state after t={:.6f}", time_);
      return AdvanceResult{AdvanceResult::Kind::Diverged,
                           time_,
                           std::nullopt,
                           "non-finite state after t=" + std::to_string(time_)};
    }

    state_ = std::move(candidate);
    time_ = next;
    logSample(false);
  }

  logSample(true);
  return AdvanceResult{AdvanceResult::Kind::Completed, time_, std::nullopt, ""};
}

// ========== RigidBodySimulationFactory ==========

RigidBodySimulationFactory::RigidBodySimulationFactory(
  std::shared_ptr<TaskStateMachineFactory> taskFactory,
  RigidBodySimulation::Config config,
  std::shared_ptr<spdlog::logger> logger)
  : taskFactory_{std::move(taskFactory)},
    config_{std::move(config)},
    logger_{std::move(logger)}
{
}

std::unique_ptr<Simulation> RigidBodySimulationFactory::build(
  std::shared_ptr<const KinematicModel> model,
  const SegmentContext& context)
{
  std::unique_ptr<TaskStateMachine> task;
  if (taskFactory_)
  {
    task = taskFactory_->create(model, context.progress);
  }
  return std::make_unique<RigidBodySimulation>(std::move(model),
                                               std::move(task),
                                               config_,
                                               context.lastCutTime,
                                               context.progress,
                                               logger_);
}

}  // namespace cut_sim
