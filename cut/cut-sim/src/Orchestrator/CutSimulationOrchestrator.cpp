// Ticket: 0001_cut_orchestrator

#include "cut-sim/src/Orchestrator/CutSimulationOrchestrator.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace cut_sim
{

std::string_view toString(Termination termination)
{
  switch (termination)
  {
    case Termination::Completed:
      return "completed";
    case Termination::TaskComplete:
      return "task complete";
    case Termination::Cancelled:
      return "cancelled";
    case Termination::Diverged:
      return "diverged";
    case Termination::TopologyFailure:
      return "topology failure";
    case Termination::CutLimitReached:
      return "cut limit reached";
  }
  return "unknown";
}

LoopTransition classifyAdvance(const AdvanceResult& result)
{
  switch (result.kind)
  {
    case AdvanceResult::Kind::Completed:
      return LoopTransition::Completed;
    case AdvanceResult::Kind::CutInterrupt:
      return result.cut ? LoopTransition::ContinueWithNewTopology
                        : LoopTransition::Fatal;
    case AdvanceResult::Kind::TaskComplete:
    case AdvanceResult::Kind::Diverged:
      return LoopTransition::EarlyStop;
  }
  return LoopTransition::Fatal;
}

CutSimulationOrchestrator::CutSimulationOrchestrator(
  SimulationFactory& simulations,
  TopologyTransform& topology,
  std::shared_ptr<spdlog::logger> logger)
  : CutSimulationOrchestrator{simulations, topology, std::move(logger), Config{}}
{
}

CutSimulationOrchestrator::CutSimulationOrchestrator(
  SimulationFactory& simulations,
  TopologyTransform& topology,
  std::shared_ptr<spdlog::logger> logger,
  Config config)
  : simulations_{simulations},
    topology_{topology},
    logger_{std::move(logger)},
    config_{config}
{
  if (!logger_)
  {
    throw std::invalid_argument("CutSimulationOrchestrator: logger must not be null");
  }
}

void CutSimulationOrchestrator::recordSegment(const LiveSlot& slot,
                                              ReplayBuffer& replay) const
{
  SampledTrajectory effort = slot.simulation->effortLog();
  std::optional<SampledTrajectory> effortLog;
  if (effort.rows() > 0)
  {
    effortLog = std::move(effort);
  }
  replay.append(slot.model, slot.simulation->stateLog(), std::move(effortLog));
}

RunResult CutSimulationOrchestrator::run(
  std::shared_ptr<const KinematicModel> initialModel,
  const StateVector& initialState,
  double duration,
  std::stop_token stop)
{
  if (!initialModel)
  {
    throw std::invalid_argument("CutSimulationOrchestrator: initial model is null");
  }
  initialModel->validateState(initialState);
  if (!(duration > 0.0) || !std::isfinite(duration))
  {
    throw std::invalid_argument(
      "CutSimulationOrchestrator: duration must be positive and finite");
  }

  RunResult result;
  LiveSlot slot{std::move(initialModel), initialState, nullptr};
  double t = 0.0;
  std::optional<double> lastCutTime;
  TaskProgress progress;
  bool running = true;

  logger_->info("Run started: {} bodies, duration {:.3f} s",
                slot.model->bodyCount(),
                duration);

  auto stopWith = [&](Termination termination, std::string detail)
  {
    result.termination = termination;
    result.detail = std::move(detail);
    running = false;
  };

  while (running)
  {
    if (stop.stop_requested())
    {
      logger_->warn("Run cancelled at t={:.4f}", t);
      stopWith(Termination::Cancelled, "stop requested");
      break;
    }

    // ===== One segment on the live topology =====
    slot.simulation = simulations_.build(slot.model, SegmentContext{lastCutTime, progress});
    if (!slot.simulation)
    {
      throw std::runtime_error("CutSimulationOrchestrator: factory returned no simulation");
    }
    slot.simulation->initialize(slot.state, t);
    const AdvanceResult advance = slot.simulation->advanceTo(duration);

    slot.state = slot.simulation->state();
    t = slot.simulation->time();
    progress = slot.simulation->taskProgress();
    recordSegment(slot, result.replay);

    switch (classifyAdvance(advance))
    {
      case LoopTransition::Completed:
        logger_->info("Run completed at t={:.4f} after {} cuts", t, result.cutCount);
        stopWith(Termination::Completed, advance.detail);
        break;

      case LoopTransition::EarlyStop:
        if (advance.kind == AdvanceResult::Kind::Diverged)
        {
          logger_->warn("Run diverged at t={:.4f}: {}", t, advance.detail);
          stopWith(Termination::Diverged, advance.detail);
        }
        else
        {
          logger_->info("Task complete at t={:.4f} after {} cuts", t, result.cutCount);
          stopWith(Termination::TaskComplete, advance.detail);
        }
        break;

      case LoopTransition::Fatal:
        logger_->error("Cut interrupt at t={:.4f} carried no cut event", t);
        stopWith(Termination::TopologyFailure, "cut interrupt without a cut event");
        break;

      case LoopTransition::ContinueWithNewTopology:
      {
        if (config_.maxCuts && result.cutCount >= *config_.maxCuts)
        {
          logger_->warn("Cut limit of {} reached at t={:.4f}", *config_.maxCuts, t);
          stopWith(Termination::CutLimitReached, "cut limit reached");
          break;
        }

        const CutEvent& event = *advance.cut;
        TopologyChange change;
        try
        {
          change = topology_.cut(slot.model, slot.state, event);
          if (!change.newModel)
          {
            throw TopologyError("topology transform returned no model");
          }
          change.newModel->validateState(change.newState);
        }
        catch (const TopologyError& e)
        {
          logger_->error("Topology transform failed at t={:.4f}: {}", t, e.what());
          stopWith(Termination::TopologyFailure, e.what());
          break;
        }
        catch (const std::invalid_argument& e)
        {
          logger_->error("Topology transform gave an inconsistent state at t={:.4f}: {}",
                         t,
                         e.what());
          stopWith(Termination::TopologyFailure, e.what());
          break;
        }

        ++result.cutCount;
        lastCutTime = t;
        logger_->info("Cut {} of '{}' at t={:.4f}: {} -> {} bodies",
                      result.cutCount,
                      slot.model->body(event.bodyIndex).name,
                      t,
                      slot.model->bodyCount(),
                      change.newModel->bodyCount());

        // Releases the finished simulation and everything bound to the old model
        slot = LiveSlot{std::move(change.newModel), std::move(change.newState), nullptr};
        break;
      }
    }
  }

  result.finalTime = t;
  result.finalModel = slot.model;
  result.finalState = slot.state;
  result.taskProgress = progress;
  return result;
}

}  // namespace cut_sim
