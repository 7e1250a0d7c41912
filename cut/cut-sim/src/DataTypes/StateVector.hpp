// Ticket: 0002_kinematic_model

#ifndef CUT_SIM_DATA_TYPES_STATE_VECTOR_HPP
#define CUT_SIM_DATA_TYPES_STATE_VECTOR_HPP

#include <Eigen/Dense>

namespace cut_sim
{

/**
 * @brief Flat continuous state of a plant: generalized positions followed by
 * generalized velocities
 *
 * Length is always KinematicModel::positionCount() +
 * KinematicModel::velocityCount() of the model the state belongs to. A state
 * never outlives a topology change without being remapped.
 */
using StateVector = Eigen::VectorXd;

/**
 * @brief Structured divergence check
 * @return true if every component is finite (no NaN, no inf)
 */
[[nodiscard]] inline bool isFinite(const StateVector& x)
{
  return x.allFinite();
}

}  // namespace cut_sim

#endif  // CUT_SIM_DATA_TYPES_STATE_VECTOR_HPP
