// Ticket: 0001_cut_orchestrator

#ifndef CUT_SIM_TEST_HELPERS_FAKE_COLLABORATORS_HPP
#define CUT_SIM_TEST_HELPERS_FAKE_COLLABORATORS_HPP

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cut-sim/src/Physics/Simulation.hpp"
#include "cut-sim/src/Planning/KinematicsSolver.hpp"

namespace cut_sim::test
{

// ============================================================================
// Kinematics solver
// ============================================================================

/**
 * @brief Returns the seed unchanged with a fixed status and keeps every
 * problem it was given
 */
class RecordingKinematicsSolver : public KinematicsSolver
{
public:
  explicit RecordingKinematicsSolver(int status = solver_status::kSuccess)
    : status_{status}
  {
  }

  [[nodiscard]] KinematicsSolution solve(const TrajectoryProblem& problem) override
  {
    problems.push_back(problem);
    return KinematicsSolution{problem.seed, status_};
  }

  void setStatus(int status)
  {
    status_ = status;
  }

  std::vector<TrajectoryProblem> problems;

private:
  int status_;
};

// ============================================================================
// Simulation
// ============================================================================

/// What one scripted segment does when advanced
struct ScriptedOutcome
{
  AdvanceResult::Kind kind{AdvanceResult::Kind::Completed};
  double time{0.0};          ///< Stop time, ignored for Completed
  std::string cutBody;       ///< Body cut at its center for CutInterrupt
  bool omitCutEvent{false};  ///< Report CutInterrupt without an event
};

/**
 * @brief Simulation that holds its initial state and stops as scripted
 *
 * Logs a sample at initialization, at every 0.1 s in between and at the
 * stop time. Reports the carried progress with objectsPicked incremented.
 */
class ScriptedSimulation : public Simulation
{
public:
  ScriptedSimulation(std::shared_ptr<const KinematicModel> model,
                     ScriptedOutcome outcome,
                     TaskProgress progress)
    : model_{std::move(model)}, outcome_{std::move(outcome)}, progress_{std::move(progress)}
  {
    ++progress_.objectsPicked;
  }

  void initialize(const StateVector& x, double t) override
  {
    model_->validateState(x);
    state_ = x;
    time_ = t;
    times_ = {t};
  }

  [[nodiscard]] AdvanceResult advanceTo(double tEnd) override
  {
    const double stop =
      outcome_.kind == AdvanceResult::Kind::Completed ? tEnd : std::min(outcome_.time, tEnd);
    for (double t = time_ + 0.1; t < stop - 1e-9; t += 0.1)
    {
      times_.push_back(t);
    }
    if (stop > time_)
    {
      times_.push_back(stop);
    }
    time_ = stop;

    AdvanceResult result{outcome_.kind, time_, std::nullopt, "scripted"};
    if (outcome_.kind == AdvanceResult::Kind::CutInterrupt && !outcome_.omitCutEvent)
    {
      const size_t index = model_->bodyIndex(outcome_.cutBody);
      const Eigen::Index start = model_->positionStart(index);
      result.cut = CutEvent{index, state_.segment<3>(start), Eigen::Vector3d::UnitX(), time_};
    }
    return result;
  }

  [[nodiscard]] const StateVector& state() const override
  {
    return state_;
  }

  [[nodiscard]] double time() const override
  {
    return time_;
  }

  [[nodiscard]] SampledTrajectory stateLog() const override
  {
    return SampledTrajectory{times_,
                             state_.replicate(1, static_cast<Eigen::Index>(times_.size()))};
  }

  [[nodiscard]] SampledTrajectory effortLog() const override
  {
    return SampledTrajectory{times_,
                             Eigen::MatrixXd(0, static_cast<Eigen::Index>(times_.size()))};
  }

  [[nodiscard]] TaskProgress taskProgress() const override
  {
    return progress_;
  }

private:
  std::shared_ptr<const KinematicModel> model_;
  ScriptedOutcome outcome_;
  TaskProgress progress_;
  StateVector state_;
  double time_{0.0};
  std::vector<double> times_;
};

/**
 * @brief Hands out one ScriptedSimulation per build, consuming outcomes in
 * order; runs to completion once the script is exhausted
 */
class ScriptedSimulationFactory : public SimulationFactory
{
public:
  explicit ScriptedSimulationFactory(std::deque<ScriptedOutcome> script)
    : script_{std::move(script)}
  {
  }

  [[nodiscard]] std::unique_ptr<Simulation> build(
    std::shared_ptr<const KinematicModel> model,
    const SegmentContext& context) override
  {
    models.push_back(model);
    contexts.push_back(context);
    ScriptedOutcome outcome;
    if (!script_.empty())
    {
      outcome = script_.front();
      script_.pop_front();
    }
    if (onBuild)
    {
      onBuild(models.size());
    }
    return std::make_unique<ScriptedSimulation>(std::move(model), outcome, context.progress);
  }

  std::vector<std::shared_ptr<const KinematicModel>> models;
  std::vector<SegmentContext> contexts;
  std::function<void(size_t)> onBuild;

private:
  std::deque<ScriptedOutcome> script_;
};

}  // namespace cut_sim::test

#endif  // CUT_SIM_TEST_HELPERS_FAKE_COLLABORATORS_HPP
