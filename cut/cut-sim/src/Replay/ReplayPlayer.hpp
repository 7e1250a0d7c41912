// Ticket: 0007_replay_buffer

#ifndef CUT_SIM_REPLAY_REPLAY_PLAYER_HPP
#define CUT_SIM_REPLAY_REPLAY_PLAYER_HPP

#include <stop_token>

#include "cut-sim/src/Replay/ReplayBuffer.hpp"
#include "cut-sim/src/Replay/ReplayViewer.hpp"

namespace cut_sim
{

/// How often a finished run is played back
enum class PlaybackMode
{
  Skip,
  Once,
  Loop  ///< Until a stop is requested
};

/**
 * @brief Playback for the command-line flags
 *
 * The flags are independent: @p headless drops the single pass after the run,
 * @p loopForever loops until stopped with or without @p headless.
 */
[[nodiscard]] PlaybackMode playbackMode(bool headless, bool loopForever);

/**
 * @brief Walks a ReplayBuffer frame by frame into a ReplayViewer
 *
 * Frames are drawn every drawTimestep of simulated time within each segment,
 * plus the segment's end time. The viewer is re-initialized at every change of
 * model. With realtimeRate > 0 playback sleeps so that one simulated second
 * lasts 1 / realtimeRate wall seconds.
 */
class ReplayPlayer
{
public:
  struct Config
  {
    double drawTimestep{1.0 / 30.0};  // [s]
    double realtimeRate{0.0};         // 0 plays as fast as possible
  };

  /**
   * @throws std::invalid_argument for a non-positive draw timestep
   */
  ReplayPlayer(ReplayViewer& viewer, Config config);

  /**
   * @brief Play the buffer once
   * @return Number of frames drawn
   */
  size_t play(const ReplayBuffer& buffer, std::stop_token stop = {});

  /**
   * @brief Play the buffer as often as @p mode asks
   * @return Number of passes started; 0 for an empty buffer
   */
  size_t run(const ReplayBuffer& buffer, PlaybackMode mode, std::stop_token stop = {});

private:
  ReplayViewer& viewer_;
  Config config_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_REPLAY_REPLAY_PLAYER_HPP
