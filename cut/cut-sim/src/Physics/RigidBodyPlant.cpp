// Ticket: 0006_rigid_body_plant

#include "cut-sim/src/Physics/RigidBodyPlant.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

namespace
{

constexpr double kRateStep = 1e-6;
constexpr double kVelocityStep = 1e-4;

bool isStatic(const KinematicModel& model, size_t index)
{
  int current = static_cast<int>(index);
  while (current != Body::kWorld)
  {
    const Body& body = model.body(static_cast<size_t>(current));
    if (body.joint.type != JointType::Fixed)
    {
      return false;
    }
    current = body.parent;
  }
  return true;
}

}  // namespace

RigidBodyPlant::RigidBodyPlant(std::shared_ptr<const KinematicModel> model,
                               const RobotLayout& layout,
                               Config config)
  : model_{std::move(model)}, config_{std::move(config)}
{
  if (!model_)
  {
    throw std::invalid_argument("RigidBodyPlant: null model");
  }
  if (config_.bladeDirection.norm() == 0.0)
  {
    throw std::invalid_argument("RigidBodyPlant: blade direction must be non-zero");
  }
  config_.bladeDirection.normalize();

  for (size_t i = 0; i < model_->bodyCount(); ++i)
  {
    const Body& body = model_->body(i);
    if (body.joint.type == JointType::Floating)
    {
      if (!(body.mass > 0.0) || !body.hasGeometry())
      {
        throw std::invalid_argument("RigidBodyPlant: floating body '" +
                                    body.name + "' needs mass and geometry");
      }
      floatingBodies_.push_back(i);
    }
    else if (jointDimension(body.joint.type) == 1)
    {
      oneDofIndices_.push_back(model_->positionStart(i));
    }
    else if (body.hasGeometry() && isStatic(*model_, i))
    {
      staticBoxes_.push_back(i);
    }
  }

  if (!layout.bladeBody.empty())
  {
    bladeBody_ = model_->bodyIndex(layout.bladeBody);
    if (!model_->body(*bladeBody_).hasGeometry())
    {
      throw std::invalid_argument("RigidBodyPlant: blade body has no geometry");
    }
  }
  if (!layout.leftFingerJoint.empty() && !layout.rightFingerJoint.empty() &&
      !layout.endEffectorFrame.empty())
  {
    leftFinger_ = model_->jointPositionIndex(layout.leftFingerJoint);
    rightFinger_ = model_->jointPositionIndex(layout.rightFingerJoint);
    endEffector_ = &model_->frame(layout.endEffectorFrame);
  }
}

std::optional<double> RigidBodyPlant::gripperOpening(const Eigen::VectorXd& q) const
{
  if (!leftFinger_ || !rightFinger_)
  {
    return std::nullopt;
  }
  return q[*leftFinger_] + q[*rightFinger_];
}

Eigen::Vector3d RigidBodyPlant::contactForce(double depth,
                                             const Eigen::Vector3d& normal,
                                             const Eigen::Vector3d& relativeVelocity) const
{
  const double normalSpeed = relativeVelocity.dot(normal);
  const double normalForce =
    config_.contactStiffness * depth - config_.contactDamping * normalSpeed;
  if (normalForce <= 0.0)
  {
    return Eigen::Vector3d::Zero();
  }

  const Eigen::Vector3d slip = relativeVelocity - normalSpeed * normal;
  const double slipSpeed = slip.norm();
  const Eigen::Vector3d friction =
    -config_.friction * normalForce * slip / std::max(slipSpeed, config_.slipVelocity);
  return normalForce * normal + friction;
}

std::optional<std::pair<double, Eigen::Vector3d>> RigidBodyPlant::boxPenetration(
  const Eigen::Vector3d& point,
  const Eigen::Isometry3d& box,
  const Eigen::Vector3d& halfExtents)
{
  const Eigen::Vector3d local = box.linear().transpose() * (point - box.translation());
  const Eigen::Vector3d depths = halfExtents - local.cwiseAbs();
  if ((depths.array() <= 0.0).any())
  {
    return std::nullopt;
  }
  Eigen::Index axis = 0;
  const double depth = depths.minCoeff(&axis);
  const Eigen::Vector3d localNormal =
    Eigen::Vector3d::Unit(axis) * (local[axis] >= 0.0 ? 1.0 : -1.0);
  return std::make_pair(depth, Eigen::Vector3d{box.linear() * localNormal});
}

Eigen::Vector3d RigidBodyPlant::jointAxisWorld(
  size_t bodyIndex,
  const std::vector<Eigen::Isometry3d>& transforms) const
{
  const Body& body = model_->body(bodyIndex);
  Eigen::Matrix3d parentRotation = Eigen::Matrix3d::Identity();
  if (body.parent != Body::kWorld)
  {
    parentRotation = transforms[static_cast<size_t>(body.parent)].linear();
  }
  return parentRotation * body.joint.origin.linear() * body.joint.axis.normalized();
}

RigidBodyPlant::Derivatives RigidBodyPlant::evaluate(const StateVector& x,
                                                     const Eigen::VectorXd& effort) const
{
  model_->validateState(x);
  const Eigen::Index nv = model_->velocityCount();
  if (effort.size() != nv)
  {
    throw std::invalid_argument("RigidBodyPlant: effort size mismatch");
  }

  const Eigen::VectorXd q = model_->positions(x);
  const Eigen::VectorXd v = model_->velocities(x);
  const std::vector<Eigen::Isometry3d> transforms = model_->forwardKinematics(q);

  Derivatives result;
  result.acceleration = Eigen::VectorXd::Zero(nv);
  Eigen::VectorXd jointForce = effort;

  // ===== Floating Body Kinematics =====

  std::vector<BodyKinematics> kinematics;
  std::vector<Wrench> wrenches(floatingBodies_.size());
  kinematics.reserve(floatingBodies_.size());
  for (size_t f = 0; f < floatingBodies_.size(); ++f)
  {
    const size_t i = floatingBodies_[f];
    const Eigen::Index s = model_->positionStart(i);
    const Eigen::Vector3d rpy = q.segment<3>(s + 3);
    kinematics.push_back(BodyKinematics{transforms[i].translation(),
                                        transforms[i].linear(),
                                        v.segment<3>(s),
                                        rpyRateToAngularVelocity(rpy) *
                                          v.segment<3>(s + 3)});
    wrenches[f].force = model_->body(i).mass * config_.gravity;
  }

  auto applyAt = [&](size_t f, const Eigen::Vector3d& point, const Eigen::Vector3d& force)
  {
    wrenches[f].force += force;
    wrenches[f].torque += (point - kinematics[f].position).cross(force);
  };

  // ===== Corner Contacts =====

  for (size_t f = 0; f < floatingBodies_.size(); ++f)
  {
    const Body& body = model_->body(floatingBodies_[f]);
    const BodyKinematics& k = kinematics[f];
    for (int corner = 0; corner < 8; ++corner)
    {
      const Eigen::Vector3d sign{(corner & 1) ? 1.0 : -1.0,
                                 (corner & 2) ? 1.0 : -1.0,
                                 (corner & 4) ? 1.0 : -1.0};
      const Eigen::Vector3d point =
        k.position + k.rotation * body.halfExtents.cwiseProduct(sign);
      const Eigen::Vector3d pointVelocity = k.pointVelocity(point);

      if (point.z() < 0.0)
      {
        applyAt(f, point, contactForce(-point.z(), Eigen::Vector3d::UnitZ(), pointVelocity));
      }

      for (const size_t b : staticBoxes_)
      {
        if (auto hit = boxPenetration(point, transforms[b], model_->body(b).halfExtents))
        {
          applyAt(f, point, contactForce(hit->first, hit->second, pointVelocity));
        }
      }

      for (size_t g = 0; g < floatingBodies_.size(); ++g)
      {
        if (g == f)
        {
          continue;
        }
        const size_t other = floatingBodies_[g];
        if (auto hit = boxPenetration(point, transforms[other], model_->body(other).halfExtents))
        {
          const Eigen::Vector3d relative =
            pointVelocity - kinematics[g].pointVelocity(point);
          const Eigen::Vector3d force = contactForce(hit->first, hit->second, relative);
          applyAt(f, point, force);
          applyAt(g, point, -force);
        }
      }
    }
  }

  // ===== Blade =====

  if (bladeBody_)
  {
    const Body& blade = model_->body(*bladeBody_);
    const Eigen::Isometry3d& bladePose = transforms[*bladeBody_];
    const bool bladeActuated = jointDimension(blade.joint.type) == 1;
    const Eigen::Index bladeIndex = model_->positionStart(*bladeBody_);
    Eigen::Vector3d bladeVelocity = Eigen::Vector3d::Zero();
    Eigen::Vector3d bladeAxis = Eigen::Vector3d::Zero();
    if (bladeActuated && blade.joint.type == JointType::Prismatic)
    {
      bladeAxis = jointAxisWorld(*bladeBody_, transforms);
      bladeVelocity = bladeAxis * v[bladeIndex];
    }

    const int samples = std::max(config_.bladeSamples, 1);
    for (size_t f = 0; f < floatingBodies_.size(); ++f)
    {
      const size_t i = floatingBodies_[f];
      const Body& body = model_->body(i);
      if (!body.cuttable)
      {
        continue;
      }

      Eigen::Vector3d total = Eigen::Vector3d::Zero();
      Eigen::Vector3d pointSum = Eigen::Vector3d::Zero();
      int touching = 0;
      for (int n = 0; n < samples; ++n)
      {
        const double u = samples == 1 ? 0.0 : -1.0 + 2.0 * n / (samples - 1);
        const Eigen::Vector3d point =
          bladePose * Eigen::Vector3d{0.0, u * blade.halfExtents.y(), -blade.halfExtents.z()};
        auto hit = boxPenetration(point, transforms[i], body.halfExtents);
        if (!hit)
        {
          continue;
        }
        const double closing =
          (bladeVelocity - kinematics[f].pointVelocity(point)).dot(config_.bladeDirection);
        const double magnitude =
          std::max(0.0, config_.bladeStiffness * hit->first + config_.bladeDamping * closing);
        const Eigen::Vector3d force = magnitude * config_.bladeDirection;
        applyAt(f, point, force);
        total += force;
        pointSum += point;
        ++touching;
      }

      if (touching > 0)
      {
        result.bladeContacts.push_back(BladeContact{i, pointSum / touching, total});
        if (bladeActuated)
        {
          jointForce[bladeIndex] -= total.dot(bladeAxis);
        }
      }
    }
  }

  // ===== Grasp =====

  if (endEffector_ != nullptr)
  {
    const double opening = *gripperOpening(q);
    if (opening < config_.graspClosedOpening && !floatingBodies_.empty())
    {
      const Eigen::Isometry3d ee = transforms[endEffector_->body] * endEffector_->offset;
      size_t nearest = 0;
      double nearestDistance = std::numeric_limits<double>::infinity();
      for (size_t f = 0; f < floatingBodies_.size(); ++f)
      {
        const double d = (kinematics[f].position - ee.translation()).norm();
        if (d < nearestDistance)
        {
          nearest = f;
          nearestDistance = d;
        }
      }

      if (nearestDistance <= config_.graspCaptureRadius)
      {
        const Eigen::VectorXd qAhead = q + kVelocityStep * v;
        const Eigen::Vector3d eeAhead =
          model_->framePose(qAhead, *endEffector_).translation();
        const Eigen::Vector3d eeVelocity = (eeAhead - ee.translation()) / kVelocityStep;

        const BodyKinematics& k = kinematics[nearest];
        wrenches[nearest].force += config_.graspStiffness * (ee.translation() - k.position) +
                                   config_.graspDamping * (eeVelocity - k.linearVelocity);
        wrenches[nearest].torque -= config_.graspAngularDamping * k.angularVelocity;
        result.graspedBody = floatingBodies_[nearest];
      }
    }
  }

  // ===== One-Dof Joints =====

  for (const Eigen::Index j : oneDofIndices_)
  {
    result.acceleration[j] =
      (jointForce[j] - config_.jointDamping * v[j]) / config_.jointInertia;
  }

  // ===== Floating Body Accelerations =====

  for (size_t f = 0; f < floatingBodies_.size(); ++f)
  {
    const size_t i = floatingBodies_[f];
    const Body& body = model_->body(i);
    const BodyKinematics& k = kinematics[f];
    const Eigen::Index s = model_->positionStart(i);

    const Eigen::Matrix3d inertia = k.rotation * body.boxInertia() * k.rotation.transpose();
    const Eigen::Vector3d omega = k.angularVelocity;
    const Eigen::Vector3d torque =
      wrenches[f].torque - omega.cross(inertia * omega) - config_.angularDamping * omega;
    const Eigen::Vector3d alpha = inertia.ldlt().solve(torque);

    // omega = E(rpy) rpyDot  =>  alpha = E rpyDDot + Edot rpyDot
    const Eigen::Vector3d rpy = q.segment<3>(s + 3);
    const Eigen::Vector3d rpyDot = v.segment<3>(s + 3);
    const Eigen::Matrix3d E = rpyRateToAngularVelocity(rpy);
    const Eigen::Matrix3d Edot =
      (rpyRateToAngularVelocity(rpy + kRateStep * rpyDot) - E) / kRateStep;

    result.acceleration.segment<3>(s) = wrenches[f].force / body.mass;
    result.acceleration.segment<3>(s + 3) = E.inverse() * (alpha - Edot * rpyDot);
  }

  return result;
}

StateVector RigidBodyPlant::step(const StateVector& x,
                                 const Eigen::VectorXd& acceleration,
                                 double dt) const
{
  const Eigen::Index nq = model_->positionCount();
  Eigen::VectorXd velocity = model_->velocities(x) + acceleration * dt;
  Eigen::VectorXd position = model_->positions(x) + velocity * dt;

  const Eigen::VectorXd lower = model_->lowerLimits();
  const Eigen::VectorXd upper = model_->upperLimits();
  for (const Eigen::Index j : oneDofIndices_)
  {
    if (position[j] < lower[j])
    {
      position[j] = lower[j];
      velocity[j] = std::max(velocity[j], 0.0);
    }
    else if (position[j] > upper[j])
    {
      position[j] = upper[j];
      velocity[j] = std::min(velocity[j], 0.0);
    }
  }

  StateVector next(2 * nq);
  next << position, velocity;
  return next;
}

}  // namespace cut_sim
