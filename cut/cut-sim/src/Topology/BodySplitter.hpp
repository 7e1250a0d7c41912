// Ticket: 0004_topology_transform

#ifndef CUT_SIM_TOPOLOGY_BODY_SPLITTER_HPP
#define CUT_SIM_TOPOLOGY_BODY_SPLITTER_HPP

#include "cut-sim/src/Topology/TopologyTransform.hpp"

namespace cut_sim
{

/**
 * @brief Splits a free box body into two boxes along the cut plane
 *
 * The cut plane is snapped to the box face direction most aligned with the
 * event normal, so both pieces remain boxes. Piece "a" (the negative side)
 * replaces the cut body at its index and keeps its state slots and frames;
 * piece "b" is appended as a new floating body with its slots at the end of
 * the position and velocity blocks. Mass divides in proportion to length.
 * Both pieces keep the parent's orientation and rigid-body velocity field.
 *
 * Piece names extend the parent name with ".a" and ".b".
 *
 * @ticket 0004_topology_transform
 */
class BodySplitter : public TopologyTransform
{
public:
  struct Config
  {
    double minPieceThickness{2e-3};  ///< Thinnest piece allowed [m]
    double containmentTolerance{1e-6};  ///< Slack on the inside-box test [m]
  };

  BodySplitter();
  explicit BodySplitter(Config config);

  ~BodySplitter() override = default;

  [[nodiscard]] TopologyChange cut(const std::shared_ptr<const KinematicModel>& model,
                                   const StateVector& state,
                                   const CutEvent& event) override;

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

  BodySplitter(const BodySplitter&) = default;
  BodySplitter& operator=(const BodySplitter&) = default;
  BodySplitter(BodySplitter&&) noexcept = default;
  BodySplitter& operator=(BodySplitter&&) noexcept = default;

private:
  Config config_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TOPOLOGY_BODY_SPLITTER_HPP
