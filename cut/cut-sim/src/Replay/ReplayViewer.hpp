// Ticket: 0007_replay_buffer

#ifndef CUT_SIM_REPLAY_REPLAY_VIEWER_HPP
#define CUT_SIM_REPLAY_REPLAY_VIEWER_HPP

#include <spdlog/spdlog.h>

#include <memory>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"

namespace cut_sim
{

/**
 * @brief Offline consumer of replayed frames
 *
 * initialize() is called before the first frame and again whenever the
 * topology changes; every draw() until the next initialize() uses that model.
 */
class ReplayViewer
{
public:
  virtual ~ReplayViewer() = default;

  virtual void initialize(const KinematicModel& model) = 0;
  virtual void draw(double t, const StateVector& x) = 0;

protected:
  ReplayViewer() = default;
  ReplayViewer(const ReplayViewer&) = default;
  ReplayViewer& operator=(const ReplayViewer&) = default;
  ReplayViewer(ReplayViewer&&) noexcept = default;
  ReplayViewer& operator=(ReplayViewer&&) noexcept = default;
};

/**
 * @brief Viewer that reports body poses through a logger
 *
 * Topology changes are logged at info, frames at debug.
 */
class LoggingReplayViewer : public ReplayViewer
{
public:
  explicit LoggingReplayViewer(std::shared_ptr<spdlog::logger> logger);

  void initialize(const KinematicModel& model) override;
  void draw(double t, const StateVector& x) override;

  [[nodiscard]] size_t framesDrawn() const
  {
    return framesDrawn_;
  }

  [[nodiscard]] size_t initializations() const
  {
    return initializations_;
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
  const KinematicModel* model_{nullptr};  ///< Non-owning, valid between initialize() calls
  size_t framesDrawn_{0};
  size_t initializations_{0};
};

}  // namespace cut_sim

#endif  // CUT_SIM_REPLAY_REPLAY_VIEWER_HPP
