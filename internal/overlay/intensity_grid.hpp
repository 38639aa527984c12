#pragma once

#include "overlay_computer.hpp"

namespace shakemap::overlay {

struct GridOptions {
  double half_width_deg{3.0};
  double spacing_deg{0.1};
};

// Throws util::ComputationError unless lat/lon/depth/mag are present,
// finite and physically plausible.
void ValidateEventMeta(const shakemap::v1::EventMeta& meta);

/*
  Ground-motion overlay on a regular grid around the epicentre.

  Each node gets PGA from the attenuation relation at its hypocentral
  distance and the matching MMI. The payload also carries the peak
  values, affected area per intensity level and the colour legend.
*/
class IntensityGridComputer final : public OverlayComputer {
 public:
  explicit IntensityGridComputer(GridOptions options);

  shakemap::v1::ShakemapResult Compute(const shakemap::v1::EventMeta& meta) const override;

  const GridOptions& options() const {
    return options_;
  }

 private:
  GridOptions options_;
};

} // namespace shakemap::overlay
