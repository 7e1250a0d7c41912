// Ticket: 0006_rigid_body_plant

#ifndef CUT_SIM_PHYSICS_SIMULATION_HPP
#define CUT_SIM_PHYSICS_SIMULATION_HPP

#include <memory>
#include <optional>
#include <string>

#include "cut-sim/src/DataTypes/CutEvent.hpp"
#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Task/TaskStateMachine.hpp"
#include "cut-sim/src/Trajectory/SampledTrajectory.hpp"

namespace cut_sim
{

/**
 * @brief How a call to Simulation::advanceTo() ended
 *
 * @c time is the simulation time the plant stopped at. For Diverged it is
 * the last time with a finite state, which is what state() then returns.
 */
struct AdvanceResult
{
  enum class Kind
  {
    Completed,     ///< Reached the requested end time
    CutInterrupt,  ///< Cutting guard fired; cut holds the event
    TaskComplete,  ///< Task state machine reported completion
    Diverged       ///< Next state was not finite
  };

  Kind kind{Kind::Completed};
  double time{0.0};
  std::optional<CutEvent> cut;
  std::string detail;
};

/**
 * @brief One plant bound to one kinematic model for one segment
 *
 * Owns everything tied to the model's topology: plant, controllers, guard,
 * task state machine and loggers. Never reused after a topology change.
 *
 * The state and effort logs sample at a fixed rate and always hold a sample
 * at the initialization time and at the time the last advanceTo() stopped.
 */
class Simulation
{
public:
  virtual ~Simulation() = default;

  /**
   * @throws std::invalid_argument if x does not match the bound model
   */
  virtual void initialize(const StateVector& x, double t) = 0;

  /**
   * @brief Advance toward @p tEnd, stopping early on a cut, task completion
   * or divergence
   */
  [[nodiscard]] virtual AdvanceResult advanceTo(double tEnd) = 0;

  [[nodiscard]] virtual const StateVector& state() const = 0;
  [[nodiscard]] virtual double time() const = 0;

  [[nodiscard]] virtual SampledTrajectory stateLog() const = 0;
  [[nodiscard]] virtual SampledTrajectory effortLog() const = 0;

  /// Task progress to carry into the next segment
  [[nodiscard]] virtual TaskProgress taskProgress() const = 0;

protected:
  Simulation() = default;
  Simulation(const Simulation&) = default;
  Simulation& operator=(const Simulation&) = default;
  Simulation(Simulation&&) noexcept = default;
  Simulation& operator=(Simulation&&) noexcept = default;
};

/**
 * @brief The only values carried from one segment into the next besides
 * state and time
 */
struct SegmentContext
{
  std::optional<double> lastCutTime;
  TaskProgress progress;
};

/**
 * @brief Builds a fresh Simulation for a model
 */
class SimulationFactory
{
public:
  virtual ~SimulationFactory() = default;

  [[nodiscard]] virtual std::unique_ptr<Simulation> build(
    std::shared_ptr<const KinematicModel> model,
    const SegmentContext& context) = 0;

protected:
  SimulationFactory() = default;
  SimulationFactory(const SimulationFactory&) = default;
  SimulationFactory& operator=(const SimulationFactory&) = default;
  SimulationFactory(SimulationFactory&&) noexcept = default;
  SimulationFactory& operator=(SimulationFactory&&) noexcept = default;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_SIMULATION_HPP
