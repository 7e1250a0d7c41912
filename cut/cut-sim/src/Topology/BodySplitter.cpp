// Ticket: 0004_topology_transform

#include "cut-sim/src/Topology/BodySplitter.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

BodySplitter::BodySplitter()
  : config_{}
{
}

BodySplitter::BodySplitter(Config config)
  : config_{config}
{
}

TopologyChange BodySplitter::cut(const std::shared_ptr<const KinematicModel>& model,
                                 const StateVector& state,
                                 const CutEvent& event)
{
  if (!model)
  {
    throw std::invalid_argument("BodySplitter: null model");
  }
  model->validateState(state);

  if (event.bodyIndex >= model->bodyCount())
  {
    throw TopologyError("BodySplitter: cut targets body index " +
                        std::to_string(event.bodyIndex) + " but the model has " +
                        std::to_string(model->bodyCount()) + " bodies");
  }
  const Body& parent = model->body(event.bodyIndex);
  if (!parent.cuttable)
  {
    throw TopologyError("BodySplitter: body '" + parent.name +
                        "' is not cuttable");
  }
  if (parent.joint.type != JointType::Floating || !parent.hasGeometry())
  {
    throw TopologyError("BodySplitter: body '" + parent.name +
                        "' is not a free box");
  }
  if (!event.cutPoint.allFinite() || !event.cutNormal.allFinite() ||
      event.cutNormal.norm() == 0.0)
  {
    throw TopologyError("BodySplitter: malformed cut plane on '" + parent.name +
                        "'");
  }

  const Eigen::Index nq = model->positionCount();
  const Eigen::Index start = model->positionStart(event.bodyIndex);
  const Eigen::VectorXd q = model->positions(state);
  const Eigen::VectorXd v = model->velocities(state);

  const Eigen::Vector3d position = q.segment<3>(start);
  const Eigen::Vector3d rpy = q.segment<3>(start + 3);
  const Eigen::Matrix3d rotation = rpyToRotation(rpy);

  const Eigen::Vector3d localPoint = rotation.transpose() * (event.cutPoint - position);
  if ((localPoint.cwiseAbs() - parent.halfExtents).maxCoeff() >
      config_.containmentTolerance)
  {
    throw TopologyError("BodySplitter: cut point lies outside body '" +
                        parent.name + "'");
  }

  Eigen::Index axis = 0;
  (rotation.transpose() * event.cutNormal).cwiseAbs().maxCoeff(&axis);

  const double half = parent.halfExtents[axis];
  const double split = localPoint[axis];
  const double lengthA = split + half;
  const double lengthB = half - split;
  if (lengthA < config_.minPieceThickness || lengthB < config_.minPieceThickness)
  {
    throw TopologyError("BodySplitter: cut of '" + parent.name +
                        "' leaves a piece thinner than " +
                        std::to_string(config_.minPieceThickness) + " m");
  }

  // Piece centers in the parent body frame
  const Eigen::Vector3d centerA = Eigen::Vector3d::Unit(axis) * (split - half) / 2.0;
  const Eigen::Vector3d centerB = Eigen::Vector3d::Unit(axis) * (split + half) / 2.0;

  Body pieceA = parent;
  pieceA.name = parent.name + ".a";
  pieceA.joint.name = parent.joint.name + ".a";
  pieceA.mass = parent.mass * lengthA / (2.0 * half);
  pieceA.halfExtents[axis] = lengthA / 2.0;

  Body pieceB = parent;
  pieceB.name = parent.name + ".b";
  pieceB.joint.name = parent.joint.name + ".b";
  pieceB.mass = parent.mass * lengthB / (2.0 * half);
  pieceB.halfExtents[axis] = lengthB / 2.0;

  KinematicModelBuilder builder{*model};
  builder.replaceBody(event.bodyIndex, pieceA);
  builder.addBody(pieceB);

  // Frames on the parent follow piece a
  for (auto& frame : builder.frames())
  {
    if (frame.body == event.bodyIndex)
    {
      frame.offset = Eigen::Translation3d{-centerA} * frame.offset;
    }
  }

  std::shared_ptr<const KinematicModel> newModel = builder.build();
  const Eigen::Index newNq = newModel->positionCount();

  StateVector newState(newModel->stateSize());
  newState.head(nq) = q;
  newState.segment(newNq, nq) = v;

  const Eigen::Vector3d linear = v.segment<3>(start);
  const Eigen::Vector3d rpyRate = v.segment<3>(start + 3);
  const Eigen::Vector3d omega = rpyRateToAngularVelocity(rpy) * rpyRate;

  const Eigen::Vector3d offsetA = rotation * centerA;
  const Eigen::Vector3d offsetB = rotation * centerB;
  const Eigen::Index startB = newModel->positionStart(newModel->bodyCount() - 1);

  newState.segment<3>(start) = position + offsetA;
  newState.segment<3>(start + 3) = rpy;
  newState.segment<3>(newNq + start) = linear + omega.cross(offsetA);
  newState.segment<3>(newNq + start + 3) = rpyRate;

  newState.segment<3>(startB) = position + offsetB;
  newState.segment<3>(startB + 3) = rpy;
  newState.segment<3>(newNq + startB) = linear + omega.cross(offsetB);
  newState.segment<3>(newNq + startB + 3) = rpyRate;

  spdlog::debug("BodySplitter: split '{}' along local axis {} at {:.4f} m into "
                "'{}' ({:.3f} kg) and '{}' ({:.3f} kg)",
                parent.name,
                axis,
                split,
                pieceA.name,
                pieceA.mass,
                pieceB.name,
                pieceB.mass);

  return TopologyChange{std::move(newModel), std::move(newState)};
}

}  // namespace cut_sim
