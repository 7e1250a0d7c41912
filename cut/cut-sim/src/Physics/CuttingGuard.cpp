// Ticket: 0005_cutting_guard

#include "cut-sim/src/Physics/CuttingGuard.hpp"

#include <stdexcept>
#include <utility>

namespace cut_sim
{

CuttingGuard::CuttingGuard(Config config, std::optional<double> lastCutTime)
  : config_{std::move(config)}, lastCutTime_{lastCutTime}
{
  if (config_.cutDirection.norm() == 0.0 || config_.cutNormal.norm() == 0.0)
  {
    throw std::invalid_argument(
      "CuttingGuard: cut direction and normal must be non-zero");
  }
  config_.cutDirection.normalize();
  config_.cutNormal.normalize();
}

std::optional<CutEvent> CuttingGuard::check(
  double t,
  const std::vector<BladeContact>& contacts) const
{
  if (lastCutTime_ && t < *lastCutTime_ + config_.refractoryPeriod)
  {
    return std::nullopt;
  }

  const BladeContact* strongest = nullptr;
  double strongestForce = config_.minCutForce;
  for (const auto& contact : contacts)
  {
    const double along = contact.force.dot(config_.cutDirection);
    if (along >= strongestForce)
    {
      strongest = &contact;
      strongestForce = along;
    }
  }

  if (strongest == nullptr)
  {
    return std::nullopt;
  }
  return CutEvent{strongest->bodyIndex, strongest->point, config_.cutNormal, t};
}

}  // namespace cut_sim
