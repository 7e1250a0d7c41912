// Ticket: 0010_cli

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "cut-sim/src/Orchestrator/CutSimulationOrchestrator.hpp"
#include "cut-sim/src/Physics/RigidBodySimulation.hpp"
#include "cut-sim/src/Planning/NLoptKinematicsSolver.hpp"
#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"
#include "cut-sim/src/Replay/ReplayPlayer.hpp"
#include "cut-sim/src/Replay/ReplayViewer.hpp"
#include "cut-sim/src/Task/PickAndCutStateMachine.hpp"
#include "cut-sim/src/Topology/BodySplitter.hpp"
#include "cut-sim/src/World/ExperimentWorldBuilder.hpp"
#include "cut-utils/src/Logging.hpp"

namespace
{

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int /*signal*/)
{
  interrupted = 1;
}

// Seconds (wall clock by default) mapped onto a 32-bit generator seed
std::uint32_t seedFromSeconds(double seconds)
{
  return static_cast<std::uint32_t>(std::fmod(seconds * 1000.0, 4294967296.0));
}

double wallClockSeconds()
{
  return std::chrono::duration<double>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

}  // namespace

int main(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description options("cut-exe options");
  options.add_options()("help,h", "Show this help");
  options.add_options()("duration,T", po::value<double>()->default_value(1000.0), "Duration to run the simulation [s]");
  options.add_options()("n_objects,N", po::value<size_t>()->default_value(2), "Number of objects to spawn");
  options.add_options()("seed", po::value<double>(), "RNG seed, defaults to the wall clock");
  options.add_options()("test", "Headless run: skip the playback pass after the run");
  options.add_options()("animate_forever", "Replay the finished run on a loop until interrupted, also with --test");
  options.add_options()("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical or off");

  po::variables_map vars;
  try
  {
    po::store(po::parse_command_line(argc, argv, options), vars);
    po::notify(vars);
  }
  catch (const po::error& e)
  {
    std::cerr << "cut-exe: " << e.what() << "\n" << options << std::endl;
    return 1;
  }
  if (vars.count("help"))
  {
    std::cout << options << std::endl;
    return 0;
  }

  try
  {
    spdlog::set_level(cut_utils::parseLogLevel(vars["log-level"].as<std::string>()));
    auto logger = cut_utils::getLogger("cut");

    const double duration = vars["duration"].as<double>();
    const size_t objectCount = vars["n_objects"].as<size_t>();
    const double seedSeconds =
      vars.count("seed") ? vars["seed"].as<double>() : wallClockSeconds();
    const std::uint32_t seed = seedFromSeconds(seedSeconds);
    logger->info("Seed {} ({} objects, {:.1f} s)", seed, objectCount, duration);

    // ===== Cancellation =====
    std::stop_source stopSource;
    std::signal(SIGINT, onInterrupt);
    std::jthread watcher{[&stopSource](std::stop_token watcherStop)
                         {
                           while (!watcherStop.stop_requested())
                           {
                             if (interrupted != 0)
                             {
                               stopSource.request_stop();
                               return;
                             }
                             std::this_thread::sleep_for(std::chrono::milliseconds{50});
                           }
                         }};

    // ===== World and collaborators =====
    cut_sim::ExperimentWorldBuilder::Config worldConfig;
    worldConfig.objectCount = objectCount;
    cut_sim::ExperimentWorldBuilder worldBuilder{seed, worldConfig};
    const cut_sim::ExperimentWorld world = worldBuilder.build();

    auto solver = std::make_shared<cut_sim::NLoptKinematicsSolver>();
    auto planner = std::make_shared<const cut_sim::TrajectoryPlanner>(
      solver, cut_utils::getLogger("planner"));

    cut_sim::PickAndCutStateMachine::Config taskConfig;
    taskConfig.layout = worldConfig.layout;
    taskConfig.homePosture = worldConfig.homePosture;
    auto taskFactory = std::make_shared<cut_sim::PickAndCutTaskFactory>(
      planner, taskConfig, cut_utils::getLogger("task"));

    cut_sim::RigidBodySimulation::Config simulationConfig;
    simulationConfig.layout = worldConfig.layout;
    cut_sim::RigidBodySimulationFactory simulations{
      taskFactory, simulationConfig, cut_utils::getLogger("plant")};

    cut_sim::BodySplitter splitter;
    cut_sim::CutSimulationOrchestrator orchestrator{simulations, splitter, logger};

    // ===== Run =====
    const cut_sim::RunResult result =
      orchestrator.run(world.model, world.initialState, duration, stopSource.get_token());
    logger->info("Run ended ({}) at t={:.3f} s: {} cuts, {} objects picked, {} segments",
                 cut_sim::toString(result.termination),
                 result.finalTime,
                 result.cutCount,
                 result.taskProgress.objectsPicked,
                 result.replay.size());

    // ===== Playback =====
    const cut_sim::PlaybackMode mode =
      cut_sim::playbackMode(vars.count("test") > 0, vars.count("animate_forever") > 0);
    if (mode != cut_sim::PlaybackMode::Skip)
    {
      cut_sim::LoggingReplayViewer viewer{cut_utils::getLogger("replay")};
      cut_sim::ReplayPlayer player{viewer, cut_sim::ReplayPlayer::Config{1.0 / 30.0, 1.0}};
      const size_t passes = player.run(result.replay, mode, stopSource.get_token());
      logger->info("Replayed the run {} times", passes);
    }

    if (result.termination == cut_sim::Termination::TopologyFailure)
    {
      logger->error("Run failed: {}", result.detail);
      return 1;
    }
    return 0;
  }
  catch (const std::exception& e)
  {
    spdlog::critical("cut-exe: {}", e.what());
    return 1;
  }
}
