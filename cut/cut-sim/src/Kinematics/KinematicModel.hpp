// Ticket: 0002_kinematic_model

#ifndef CUT_SIM_KINEMATICS_KINEMATIC_MODEL_HPP
#define CUT_SIM_KINEMATICS_KINEMATIC_MODEL_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"

namespace cut_sim
{

enum class JointType
{
  Fixed,      ///< Welded to the parent, no coordinates
  Revolute,   ///< One angle about axis [rad]
  Prismatic,  ///< One displacement along axis [m]
  Floating    ///< x, y, z, roll, pitch, yaw relative to the world
};

/// Number of generalized positions (and velocities) a joint contributes
[[nodiscard]] constexpr Eigen::Index jointDimension(JointType type)
{
  switch (type)
  {
    case JointType::Fixed:
      return 0;
    case JointType::Revolute:
    case JointType::Prismatic:
      return 1;
    case JointType::Floating:
      return 6;
  }
  return 0;
}

/**
 * @brief Connection of a body to its parent
 *
 * The joint frame sits at @c origin in the parent body frame; the joint motion
 * is applied after the origin transform.
 */
struct Joint
{
  std::string name;
  JointType type{JointType::Fixed};
  Eigen::Vector3d axis{Eigen::Vector3d::UnitZ()};
  Eigen::Isometry3d origin{Eigen::Isometry3d::Identity()};
  double lowerLimit{-std::numeric_limits<double>::infinity()};
  double upperLimit{std::numeric_limits<double>::infinity()};
};

/**
 * @brief A rigid body with box collision geometry centered on its frame
 */
struct Body
{
  static constexpr int kWorld = -1;

  std::string name;
  int parent{kWorld};
  Joint joint;
  double mass{0.0};                                           // [kg]
  Eigen::Vector3d halfExtents{Eigen::Vector3d::Zero()};       // [m]
  bool cuttable{false};

  [[nodiscard]] bool hasGeometry() const
  {
    return (halfExtents.array() > 0.0).all();
  }

  /// Principal inertia of a solid box about its center, body frame
  [[nodiscard]] Eigen::Matrix3d boxInertia() const;
};

/**
 * @brief Named frame rigidly attached to a body
 */
struct Frame
{
  std::string name;
  size_t body{0};
  Eigen::Isometry3d offset{Eigen::Isometry3d::Identity()};
};

/**
 * @brief Immutable topology of jointed rigid bodies
 *
 * Bodies are stored parent-before-child. Generalized positions are laid out
 * body by body in storage order, each body's joint coordinates contiguous;
 * velocities use the same layout. The model is built once through
 * KinematicModelBuilder and shared read-only as
 * std::shared_ptr<const KinematicModel> by everything bound to one
 * simulation segment. A topology change produces a new model, it never
 * mutates an existing one.
 *
 * @ticket 0002_kinematic_model
 */
class KinematicModel
{
public:
  /// Only KinematicModelBuilder can mint one, so only it can construct models
  class BuildKey
  {
  private:
    friend class KinematicModelBuilder;
    BuildKey() = default;
  };

  KinematicModel(BuildKey key,
                 std::vector<Body> bodies,
                 std::vector<Frame> frames,
                 std::vector<Eigen::Index> positionStarts,
                 Eigen::Index positionCount);

  [[nodiscard]] size_t bodyCount() const
  {
    return bodies_.size();
  }

  [[nodiscard]] Eigen::Index positionCount() const
  {
    return positionCount_;
  }

  [[nodiscard]] Eigen::Index velocityCount() const
  {
    return positionCount_;
  }

  [[nodiscard]] Eigen::Index stateSize() const
  {
    return positionCount() + velocityCount();
  }

  [[nodiscard]] const Body& body(size_t index) const;

  [[nodiscard]] const std::vector<Body>& bodies() const
  {
    return bodies_;
  }

  [[nodiscard]] const std::vector<Frame>& frames() const
  {
    return frames_;
  }

  /// First position index of a body's joint coordinates
  [[nodiscard]] Eigen::Index positionStart(size_t bodyIndex) const;

  [[nodiscard]] std::optional<size_t> findBody(std::string_view name) const;

  /**
   * @throws std::invalid_argument if no body has that name
   */
  [[nodiscard]] size_t bodyIndex(std::string_view name) const;

  /**
   * @throws std::invalid_argument if no frame has that name
   */
  [[nodiscard]] const Frame& frame(std::string_view name) const;

  /**
   * @brief Position index of a one-dof joint
   * @throws std::invalid_argument if the joint is unknown or not one-dof
   */
  [[nodiscard]] Eigen::Index jointPositionIndex(std::string_view jointName) const;

  /**
   * @brief Split all position indices into driven and frozen sets
   *
   * @param controlledJoints Names of one-dof joints driven by a plan
   * @return {controlled indices in the order given, every other index
   * ascending}
   * @throws std::invalid_argument for unknown or duplicated joint names
   */
  [[nodiscard]] std::pair<std::vector<Eigen::Index>, std::vector<Eigen::Index>>
  splitPositionIndices(const std::vector<std::string>& controlledJoints) const;

  [[nodiscard]] Eigen::VectorXd lowerLimits() const;
  [[nodiscard]] Eigen::VectorXd upperLimits() const;
  [[nodiscard]] Eigen::VectorXd clampToLimits(const Eigen::VectorXd& q) const;

  /**
   * @brief World transform of every body
   * @param q Generalized positions (positionCount())
   * @throws std::invalid_argument on size mismatch
   */
  [[nodiscard]] std::vector<Eigen::Isometry3d> forwardKinematics(
    const Eigen::VectorXd& q) const;

  [[nodiscard]] Eigen::Isometry3d framePose(const Eigen::VectorXd& q,
                                            const Frame& frame) const;

  [[nodiscard]] Eigen::Isometry3d framePose(const Eigen::VectorXd& q,
                                            std::string_view frameName) const
  {
    return framePose(q, frame(frameName));
  }

  /// Parent/child or sibling bodies, excluded from separation checks
  [[nodiscard]] bool areAdjacent(size_t a, size_t b) const;

  /**
   * @throws std::invalid_argument unless x.size() == stateSize()
   */
  void validateState(const StateVector& x) const;

  [[nodiscard]] Eigen::VectorXd positions(const StateVector& x) const
  {
    return x.head(positionCount_);
  }

  [[nodiscard]] Eigen::VectorXd velocities(const StateVector& x) const
  {
    return x.tail(positionCount_);
  }

private:
  [[nodiscard]] Eigen::Isometry3d jointTransform(const Body& body,
                                                 const Eigen::VectorXd& q,
                                                 Eigen::Index start) const;

  std::vector<Body> bodies_;
  std::vector<Frame> frames_;
  std::vector<Eigen::Index> positionStarts_;
  Eigen::Index positionCount_{0};
};

/**
 * @brief Assembles a KinematicModel
 *
 * Bodies must be added parent-before-child. Floating bodies must hang off the
 * world. Starting from an existing model copies its bodies and frames, which
 * is how a topology transform derives the post-cut model.
 */
class KinematicModelBuilder
{
public:
  KinematicModelBuilder() = default;
  explicit KinematicModelBuilder(const KinematicModel& base);

  /**
   * @return Index of the added body
   * @throws std::invalid_argument for duplicate names, unknown parents or a
   * floating joint not attached to the world
   */
  size_t addBody(Body body);

  /**
   * @brief Replace a body in place, keeping its index and parent
   * @throws std::invalid_argument if the joint dimension changes
   */
  void replaceBody(size_t index, Body body);

  /**
   * @throws std::invalid_argument for duplicate names or unknown bodies
   */
  void addFrame(Frame frame);

  [[nodiscard]] std::vector<Frame>& frames()
  {
    return frames_;
  }

  [[nodiscard]] std::shared_ptr<const KinematicModel> build() const;

private:
  void checkUniqueName(const std::string& name, size_t skip) const;

  std::vector<Body> bodies_;
  std::vector<Frame> frames_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_KINEMATICS_KINEMATIC_MODEL_HPP
