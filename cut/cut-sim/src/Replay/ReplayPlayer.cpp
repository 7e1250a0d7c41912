// Ticket: 0007_replay_buffer

#include "cut-sim/src/Replay/ReplayPlayer.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace cut_sim
{

PlaybackMode playbackMode(bool headless, bool loopForever)
{
  if (loopForever)
  {
    return PlaybackMode::Loop;
  }
  return headless ? PlaybackMode::Skip : PlaybackMode::Once;
}

ReplayPlayer::ReplayPlayer(ReplayViewer& viewer, Config config)
  : viewer_{viewer}, config_{config}
{
  if (!(config_.drawTimestep > 0.0))
  {
    throw std::invalid_argument("ReplayPlayer: draw timestep must be positive");
  }
}

size_t ReplayPlayer::play(const ReplayBuffer& buffer, std::stop_token stop)
{
  size_t frames = 0;
  const KinematicModel* current = nullptr;

  auto drawFrame = [&](const SimulationSegment& segment, double t)
  {
    viewer_.draw(t, segment.state.value(t));
    ++frames;
    if (config_.realtimeRate > 0.0)
    {
      std::this_thread::sleep_for(std::chrono::duration<double>(
        config_.drawTimestep / config_.realtimeRate));
    }
  };

  for (const auto& segment : buffer.segments())
  {
    if (stop.stop_requested())
    {
      break;
    }
    if (segment.model.get() != current)
    {
      current = segment.model.get();
      viewer_.initialize(*current);
    }

    const double start = segment.startTime();
    const double end = segment.endTime();
    for (size_t k = 0;; ++k)
    {
      const double t = start + static_cast<double>(k) * config_.drawTimestep;
      if (t >= end || stop.stop_requested())
      {
        break;
      }
      drawFrame(segment, t);
    }
    if (!stop.stop_requested())
    {
      drawFrame(segment, end);
    }
  }
  return frames;
}

size_t ReplayPlayer::run(const ReplayBuffer& buffer,
                         PlaybackMode mode,
                         std::stop_token stop)
{
  if (mode == PlaybackMode::Skip || buffer.empty())
  {
    return 0;
  }

  size_t passes = 0;
  do
  {
    static_cast<void>(play(buffer, stop));
    ++passes;
  } while (mode == PlaybackMode::Loop && !stop.stop_requested());
  return passes;
}

}  // namespace cut_sim
