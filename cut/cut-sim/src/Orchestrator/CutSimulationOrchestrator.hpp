// Ticket: 0001_cut_orchestrator

#ifndef CUT_SIM_ORCHESTRATOR_CUT_SIMULATION_ORCHESTRATOR_HPP
#define CUT_SIM_ORCHESTRATOR_CUT_SIMULATION_ORCHESTRATOR_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Physics/Simulation.hpp"
#include "cut-sim/src/Replay/ReplayBuffer.hpp"
#include "cut-sim/src/Task/TaskStateMachine.hpp"
#include "cut-sim/src/Topology/TopologyTransform.hpp"

namespace cut_sim
{

/// Why a run stopped
enum class Termination
{
  Completed,        ///< Reached the requested duration
  TaskComplete,     ///< Task state machine finished early
  Cancelled,        ///< Stop requested through the stop token
  Diverged,         ///< Plant state became non-finite
  TopologyFailure,  ///< A detected cut could not be applied
  CutLimitReached   ///< Config::maxCuts exceeded
};

[[nodiscard]] std::string_view toString(Termination termination);

/// What the orchestrator loop does after one advance
enum class LoopTransition
{
  ContinueWithNewTopology,
  Completed,
  EarlyStop,
  Fatal
};

/**
 * @brief Map an advance outcome onto the orchestrator loop
 *
 * A CutInterrupt without a CutEvent is a contract violation of the
 * simulation and maps to Fatal.
 */
[[nodiscard]] LoopTransition classifyAdvance(const AdvanceResult& result);

/**
 * @brief Outcome of CutSimulationOrchestrator::run
 *
 * The replay always covers [0, finalTime], also for early stops and failures.
 */
struct RunResult
{
  Termination termination{Termination::Completed};
  std::string detail;
  double finalTime{0.0};
  std::shared_ptr<const KinematicModel> finalModel;
  StateVector finalState;
  size_t cutCount{0};
  TaskProgress taskProgress;
  ReplayBuffer replay;

  /// Completed or TaskComplete
  [[nodiscard]] bool succeeded() const
  {
    return termination == Termination::Completed ||
           termination == Termination::TaskComplete;
  }
};

/**
 * @brief Runs a simulation across topology-changing cuts
 *
 * Exactly one model, state and simulation are live at any time. Each loop
 * iteration builds a fresh simulation for the live model, advances it toward
 * the run's end time and records the elapsed span as one replay segment.
 * On a cut the topology transform produces the successor model and a remapped
 * state, the live slot is replaced and the loop resumes at the cut time. The
 * previous simulation and everything it owns is released at the swap.
 *
 * Cancellation is cooperative and only observed between segments.
 *
 * @ticket 0001_cut_orchestrator
 */
class CutSimulationOrchestrator
{
public:
  struct Config
  {
    std::optional<size_t> maxCuts;  ///< Unbounded when empty
  };

  /**
   * @param simulations Builds one simulation per segment
   * @param topology Applies detected cuts
   * @param logger Receives one line per loop transition
   * @throws std::invalid_argument if logger is null
   */
  CutSimulationOrchestrator(SimulationFactory& simulations,
                            TopologyTransform& topology,
                            std::shared_ptr<spdlog::logger> logger);

  CutSimulationOrchestrator(SimulationFactory& simulations,
                            TopologyTransform& topology,
                            std::shared_ptr<spdlog::logger> logger,
                            Config config);

  /**
   * @brief Simulate [0, duration] starting from @p initialState
   *
   * @param initialModel Model the run starts on
   * @param initialState State on initialModel at t = 0
   * @param duration Absolute end time [s]
   * @param stop Checked before each segment
   * @throws std::invalid_argument for a null model, a state that does not
   * match it, or a non-positive duration
   */
  [[nodiscard]] RunResult run(std::shared_ptr<const KinematicModel> initialModel,
                              const StateVector& initialState,
                              double duration,
                              std::stop_token stop = {});

private:
  /// The single live topology, state and simulation
  struct LiveSlot
  {
    std::shared_ptr<const KinematicModel> model;
    StateVector state;
    std::unique_ptr<Simulation> simulation;
  };

  void recordSegment(const LiveSlot& slot, ReplayBuffer& replay) const;

  SimulationFactory& simulations_;
  TopologyTransform& topology_;
  std::shared_ptr<spdlog::logger> logger_;
  Config config_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_ORCHESTRATOR_CUT_SIMULATION_ORCHESTRATOR_HPP
