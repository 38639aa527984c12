#pragma once

#include <memory>

#include "shakemap/v1.hpp"

namespace shakemap::overlay {

class OverlayComputer;

struct SimulationParams {
  double lat{0};
  double lon{0};
  double depth_km{0};
  double mag{0};
};

/*
  Runs the overlay computer on a synthetic event stamped with the
  current time. Never touches the event cache.
*/
class Simulator {
 public:
  explicit Simulator(std::shared_ptr<const OverlayComputer> computer);

  shakemap::v1::ShakemapResult Simulate(const SimulationParams& params) const;

 private:
  std::shared_ptr<const OverlayComputer> computer_;
};

} // namespace shakemap::overlay
