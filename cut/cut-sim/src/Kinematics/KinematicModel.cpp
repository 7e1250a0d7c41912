// Ticket: 0002_kinematic_model

#include "cut-sim/src/Kinematics/KinematicModel.hpp"

#include <algorithm>
#include <stdexcept>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

Eigen::Matrix3d Body::boxInertia() const
{
  const Eigen::Vector3d size = 2.0 * halfExtents;
  const Eigen::Vector3d sq = size.cwiseProduct(size);
  Eigen::Matrix3d inertia = Eigen::Matrix3d::Zero();
  inertia(0, 0) = mass * (sq.y() + sq.z()) / 12.0;
  inertia(1, 1) = mass * (sq.x() + sq.z()) / 12.0;
  inertia(2, 2) = mass * (sq.x() + sq.y()) / 12.0;
  return inertia;
}

// ========== KinematicModel ==========

KinematicModel::KinematicModel(BuildKey /*key*/,
                               std::vector<Body> bodies,
                               std::vector<Frame> frames,
                               std::vector<Eigen::Index> positionStarts,
                               Eigen::Index positionCount)
  : bodies_{std::move(bodies)},
    frames_{std::move(frames)},
    positionStarts_{std::move(positionStarts)},
    positionCount_{positionCount}
{
}

const Body& KinematicModel::body(size_t index) const
{
  if (index >= bodies_.size())
  {
    throw std::invalid_argument("KinematicModel: body index " +
                                std::to_string(index) + " out of range");
  }
  return bodies_[index];
}

Eigen::Index KinematicModel::positionStart(size_t bodyIndex) const
{
  static_cast<void>(body(bodyIndex));
  return positionStarts_[bodyIndex];
}

std::optional<size_t> KinematicModel::findBody(std::string_view name) const
{
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    if (bodies_[i].name == name)
    {
      return i;
    }
  }
  return std::nullopt;
}

size_t KinematicModel::bodyIndex(std::string_view name) const
{
  auto index = findBody(name);
  if (!index)
  {
    throw std::invalid_argument("KinematicModel: unknown body '" +
                                std::string{name} + "'");
  }
  return *index;
}

const Frame& KinematicModel::frame(std::string_view name) const
{
  auto it = std::find_if(frames_.begin(),
                         frames_.end(),
                         [name](const Frame& f) { return f.name == name; });
  if (it == frames_.end())
  {
    throw std::invalid_argument("KinematicModel: unknown frame '" +
                                std::string{name} + "'");
  }
  return *it;
}

Eigen::Index KinematicModel::jointPositionIndex(std::string_view jointName) const
{
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    const Joint& joint = bodies_[i].joint;
    if (joint.name != jointName)
    {
      continue;
    }
    if (jointDimension(joint.type) != 1)
    {
      throw std::invalid_argument("KinematicModel: joint '" +
                                  std::string{jointName} +
                                  "' is not a one-dof joint");
    }
    return positionStarts_[i];
  }
  throw std::invalid_argument("KinematicModel: unknown joint '" +
                              std::string{jointName} + "'");
}

std::pair<std::vector<Eigen::Index>, std::vector<Eigen::Index>>
KinematicModel::splitPositionIndices(
  const std::vector<std::string>& controlledJoints) const
{
  std::vector<Eigen::Index> controlled;
  controlled.reserve(controlledJoints.size());
  std::vector<bool> isControlled(static_cast<size_t>(positionCount_), false);

  for (const auto& name : controlledJoints)
  {
    const Eigen::Index index = jointPositionIndex(name);
    if (isControlled[static_cast<size_t>(index)])
    {
      throw std::invalid_argument("KinematicModel: joint '" + name +
                                  "' listed twice");
    }
    isControlled[static_cast<size_t>(index)] = true;
    controlled.push_back(index);
  }

  std::vector<Eigen::Index> held;
  held.reserve(static_cast<size_t>(positionCount_) - controlled.size());
  for (Eigen::Index i = 0; i < positionCount_; ++i)
  {
    if (!isControlled[static_cast<size_t>(i)])
    {
      held.push_back(i);
    }
  }
  return {std::move(controlled), std::move(held)};
}

Eigen::VectorXd KinematicModel::lowerLimits() const
{
  Eigen::VectorXd lower =
    Eigen::VectorXd::Constant(positionCount_,
                              -std::numeric_limits<double>::infinity());
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    if (jointDimension(bodies_[i].joint.type) == 1)
    {
      lower[positionStarts_[i]] = bodies_[i].joint.lowerLimit;
    }
  }
  return lower;
}

Eigen::VectorXd KinematicModel::upperLimits() const
{
  Eigen::VectorXd upper =
    Eigen::VectorXd::Constant(positionCount_,
                              std::numeric_limits<double>::infinity());
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    if (jointDimension(bodies_[i].joint.type) == 1)
    {
      upper[positionStarts_[i]] = bodies_[i].joint.upperLimit;
    }
  }
  return upper;
}

Eigen::VectorXd KinematicModel::clampToLimits(const Eigen::VectorXd& q) const
{
  if (q.size() != positionCount_)
  {
    throw std::invalid_argument("KinematicModel: posture size mismatch");
  }
  return q.cwiseMax(lowerLimits()).cwiseMin(upperLimits());
}

Eigen::Isometry3d KinematicModel::jointTransform(const Body& body,
                                                 const Eigen::VectorXd& q,
                                                 Eigen::Index start) const
{
  Eigen::Isometry3d motion = Eigen::Isometry3d::Identity();
  switch (body.joint.type)
  {
    case JointType::Fixed:
      break;
    case JointType::Revolute:
      motion.linear() =
        Eigen::AngleAxisd{q[start], body.joint.axis.normalized()}
          .toRotationMatrix();
      break;
    case JointType::Prismatic:
      motion.translation() = body.joint.axis.normalized() * q[start];
      break;
    case JointType::Floating:
      motion.translation() = q.segment<3>(start);
      motion.linear() = rpyToRotation(q.segment<3>(start + 3));
      break;
  }
  return body.joint.origin * motion;
}

std::vector<Eigen::Isometry3d> KinematicModel::forwardKinematics(
  const Eigen::VectorXd& q) const
{
  if (q.size() != positionCount_)
  {
    throw std::invalid_argument(
      "KinematicModel::forwardKinematics: expected " +
      std::to_string(positionCount_) + " positions, got " +
      std::to_string(q.size()));
  }

  std::vector<Eigen::Isometry3d> transforms;
  transforms.reserve(bodies_.size());
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    const Body& b = bodies_[i];
    const Eigen::Isometry3d local = jointTransform(b, q, positionStarts_[i]);
    if (b.parent == Body::kWorld)
    {
      transforms.push_back(local);
    }
    else
    {
      transforms.push_back(transforms[static_cast<size_t>(b.parent)] * local);
    }
  }
  return transforms;
}

Eigen::Isometry3d KinematicModel::framePose(const Eigen::VectorXd& q,
                                            const Frame& frame) const
{
  return forwardKinematics(q)[frame.body] * frame.offset;
}

bool KinematicModel::areAdjacent(size_t a, size_t b) const
{
  const Body& bodyA = body(a);
  const Body& bodyB = body(b);
  if (bodyA.parent == static_cast<int>(b) || bodyB.parent == static_cast<int>(a))
  {
    return true;
  }
  return bodyA.parent != Body::kWorld && bodyA.parent == bodyB.parent;
}

void KinematicModel::validateState(const StateVector& x) const
{
  if (x.size() != stateSize())
  {
    throw std::invalid_argument("KinematicModel: state has " +
                                std::to_string(x.size()) +
                                " entries, model expects " +
                                std::to_string(stateSize()));
  }
}

// ========== KinematicModelBuilder ==========

KinematicModelBuilder::KinematicModelBuilder(const KinematicModel& base)
  : bodies_{base.bodies()}, frames_{base.frames()}
{
}

void KinematicModelBuilder::checkUniqueName(const std::string& name,
                                            size_t skip) const
{
  for (size_t i = 0; i < bodies_.size(); ++i)
  {
    if (i != skip && bodies_[i].name == name)
    {
      throw std::invalid_argument("KinematicModelBuilder: duplicate body '" +
                                  name + "'");
    }
  }
}

size_t KinematicModelBuilder::addBody(Body body)
{
  checkUniqueName(body.name, bodies_.size());
  if (body.parent != Body::kWorld &&
      (body.parent < 0 || static_cast<size_t>(body.parent) >= bodies_.size()))
  {
    throw std::invalid_argument("KinematicModelBuilder: body '" + body.name +
                                "' has unknown parent");
  }
  if (body.joint.type == JointType::Floating && body.parent != Body::kWorld)
  {
    throw std::invalid_argument("KinematicModelBuilder: floating body '" +
                                body.name + "' must be attached to the world");
  }
  if (body.joint.lowerLimit > body.joint.upperLimit)
  {
    throw std::invalid_argument("KinematicModelBuilder: joint '" +
                                body.joint.name + "' has inverted limits");
  }
  bodies_.push_back(std::move(body));
  return bodies_.size() - 1;
}

void KinematicModelBuilder::replaceBody(size_t index, Body body)
{
  if (index >= bodies_.size())
  {
    throw std::invalid_argument("KinematicModelBuilder: replace index out of range");
  }
  if (jointDimension(body.joint.type) !=
      jointDimension(bodies_[index].joint.type))
  {
    throw std::invalid_argument(
      "KinematicModelBuilder: replacement changes the joint dimension of '" +
      bodies_[index].name + "'");
  }
  checkUniqueName(body.name, index);
  body.parent = bodies_[index].parent;
  bodies_[index] = std::move(body);
}

void KinematicModelBuilder::addFrame(Frame frame)
{
  if (frame.body >= bodies_.size())
  {
    throw std::invalid_argument("KinematicModelBuilder: frame '" + frame.name +
                                "' attached to unknown body");
  }
  for (const auto& existing : frames_)
  {
    if (existing.name == frame.name)
    {
      throw std::invalid_argument("KinematicModelBuilder: duplicate frame '" +
                                  frame.name + "'");
    }
  }
  frames_.push_back(std::move(frame));
}

std::shared_ptr<const KinematicModel> KinematicModelBuilder::build() const
{
  std::vector<Eigen::Index> starts;
  starts.reserve(bodies_.size());
  Eigen::Index count = 0;
  for (const auto& body : bodies_)
  {
    starts.push_back(count);
    count += jointDimension(body.joint.type);
  }
  return std::make_shared<const KinematicModel>(
    KinematicModel::BuildKey{}, bodies_, frames_, std::move(starts), count);
}

}  // namespace cut_sim
