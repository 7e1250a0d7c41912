// Ticket: 0005_cutting_guard

#ifndef CUT_SIM_DATA_TYPES_CUT_EVENT_HPP
#define CUT_SIM_DATA_TYPES_CUT_EVENT_HPP

#include <Eigen/Dense>
#include <cstddef>

namespace cut_sim
{

/**
 * @brief A detected blade contact that must split a body
 *
 * Produced by the cutting guard inside a running simulation, consumed exactly
 * once by the orchestrator which forwards it to the topology transform.
 * Point and normal are expressed in the world frame.
 */
struct CutEvent
{
  size_t bodyIndex{0};
  Eigen::Vector3d cutPoint{Eigen::Vector3d::Zero()};
  Eigen::Vector3d cutNormal{Eigen::Vector3d::UnitX()};
  double time{0.0};
};

}  // namespace cut_sim

#endif  // CUT_SIM_DATA_TYPES_CUT_EVENT_HPP
