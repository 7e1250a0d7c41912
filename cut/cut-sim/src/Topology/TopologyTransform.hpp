// Ticket: 0004_topology_transform

#ifndef CUT_SIM_TOPOLOGY_TOPOLOGY_TRANSFORM_HPP
#define CUT_SIM_TOPOLOGY_TOPOLOGY_TRANSFORM_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include "cut-sim/src/DataTypes/CutEvent.hpp"
#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"

namespace cut_sim
{

/**
 * @brief A cut that cannot be applied to the model it was detected on
 *
 * Fatal for the run: the orchestrator never retries or skips a detected cut.
 */
class TopologyError : public std::runtime_error
{
public:
  explicit TopologyError(const std::string& what)
    : std::runtime_error{what}
  {
  }
};

/**
 * @brief Post-cut model and the pre-cut state re-expressed in its coordinates
 */
struct TopologyChange
{
  std::shared_ptr<const KinematicModel> newModel;
  StateVector newState;
};

/**
 * @brief Boundary to the body-splitting collaborator
 *
 * @ticket 0004_topology_transform
 */
class TopologyTransform
{
public:
  virtual ~TopologyTransform() = default;

  /**
   * @brief Split the body named by @p event
   *
   * The returned state has newModel->stateSize() entries. Slots of bodies not
   * touched by the cut carry the pre-cut values unchanged.
   *
   * @throws TopologyError if the target is not a cuttable body of @p model or
   * the cut cannot be applied
   * @throws std::invalid_argument if @p state does not match @p model
   */
  [[nodiscard]] virtual TopologyChange cut(
    const std::shared_ptr<const KinematicModel>& model,
    const StateVector& state,
    const CutEvent& event) = 0;

protected:
  TopologyTransform() = default;
  TopologyTransform(const TopologyTransform&) = default;
  TopologyTransform& operator=(const TopologyTransform&) = default;
  TopologyTransform(TopologyTransform&&) noexcept = default;
  TopologyTransform& operator=(TopologyTransform&&) noexcept = default;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TOPOLOGY_TOPOLOGY_TRANSFORM_HPP
