// Ticket: 0005_cutting_guard

#ifndef CUT_SIM_PHYSICS_CUTTING_GUARD_HPP
#define CUT_SIM_PHYSICS_CUTTING_GUARD_HPP

#include <Eigen/Dense>

#include <optional>
#include <vector>

#include "cut-sim/src/DataTypes/CutEvent.hpp"

namespace cut_sim
{

/**
 * @brief Blade contact with a cuttable body, as reported by the plant
 */
struct BladeContact
{
  size_t bodyIndex{0};
  Eigen::Vector3d point{Eigen::Vector3d::Zero()};  ///< World contact point [m]
  Eigen::Vector3d force{Eigen::Vector3d::Zero()};  ///< Force of the blade on the body [N]
};

/**
 * @brief Decides when blade contact becomes a cut
 *
 * A contact cuts when the blade pushes the body along the cut direction with
 * at least minCutForce. Among qualifying contacts the strongest wins. The
 * guard stays silent for refractoryPeriod after the previous cut so the
 * fresh pieces are not cut again by the same stroke.
 *
 * @ticket 0005_cutting_guard
 */
class CuttingGuard
{
public:
  struct Config
  {
    Eigen::Vector3d cutDirection{0.0, 0.0, -1.0};  ///< Blade travel, world
    Eigen::Vector3d cutNormal{1.0, 0.0, 0.0};      ///< Cut plane normal, world
    double minCutForce{10.0};                      ///< [N]
    double refractoryPeriod{0.5};                  ///< [s]
  };

  /**
   * @param config Thresholds and directions
   * @param lastCutTime Time of the previous cut in this run, if any
   * @throws std::invalid_argument for a zero direction or normal
   */
  CuttingGuard(Config config, std::optional<double> lastCutTime);

  /**
   * @return A cut event at time t, or nothing
   */
  [[nodiscard]] std::optional<CutEvent> check(
    double t,
    const std::vector<BladeContact>& contacts) const;

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  Config config_;
  std::optional<double> lastCutTime_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_CUTTING_GUARD_HPP
