#pragma once

#include "shakemap/v1.hpp"

namespace shakemap::overlay {

/*
  Pure transformation from event metadata to a map-ready payload.

  Throws util::ComputationError on input outside the model's domain.
*/
class OverlayComputer {
 public:
  virtual ~OverlayComputer() = default;

  virtual shakemap::v1::ShakemapResult Compute(const shakemap::v1::EventMeta& meta) const = 0;
};

} // namespace shakemap::overlay
