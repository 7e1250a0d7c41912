// Ticket: 0007_replay_buffer

#include "cut-sim/src/Replay/ReplayViewer.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

LoggingReplayViewer::LoggingReplayViewer(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("LoggingReplayViewer: logger must not be null");
  }
}

void LoggingReplayViewer::initialize(const KinematicModel& model)
{
  model_ = &model;
  ++initializations_;
  logger_->info("Replay: topology with {} bodies, {} positions",
                model.bodyCount(),
                model.positionCount());
}

void LoggingReplayViewer::draw(double t, const StateVector& x)
{
  if (model_ == nullptr)
  {
    throw std::logic_error("LoggingReplayViewer: draw() before initialize()");
  }
  model_->validateState(x);
  ++framesDrawn_;

  if (!logger_->should_log(spdlog::level::debug))
  {
    return;
  }
  const std::vector<Eigen::Isometry3d> transforms =
    model_->forwardKinematics(model_->positions(x));
  for (size_t i = 0; i < model_->bodyCount(); ++i)
  {
    const Body& body = model_->body(i);
    if (body.joint.type != JointType::Floating)
    {
      continue;
    }
    const Eigen::Vector3d p = transforms[i].translation();
    const Eigen::Vector3d rpy = rotationToRpy(transforms[i].linear());
    logger_->debug("Replay t={:.3f} {} at ({:.3f}, {:.3f}, {:.3f}) rpy ({:.3f}, {:.3f}, {:.3f})",
                   t,
                   body.name,
                   p.x(),
                   p.y(),
                   p.z(),
                   rpy.x(),
                   rpy.y(),
                   rpy.z());
  }
}

}  // namespace cut_sim
