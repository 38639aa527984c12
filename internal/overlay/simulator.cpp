#include "simulator.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"
#include "overlay_computer.hpp"

namespace shakemap::overlay {

Simulator::Simulator(std::shared_ptr<const OverlayComputer> computer) : computer_(std::move(computer)) {
  if (!computer_) {
    throw std::invalid_argument("Simulator requires an overlay computer");
  }
}

shakemap::v1::ShakemapResult Simulator::Simulate(const SimulationParams& params) const {
  observability::SpanScope span("Simulator.Simulate");
  observability::Stopwatch stopwatch;
  const auto               now = util::Now();

  shakemap::v1::EventMeta meta;
  meta.set_time_utc(util::FormatUtc(now));
  meta.set_time_th(util::FormatLocal(now, std::chrono::hours(7)));
  meta.set_lat(params.lat);
  meta.set_lon(params.lon);
  meta.set_depth_km(params.depth_km);
  meta.set_mag(params.mag);
  meta.set_place("Simulated event");
  meta.set_source("simulation");
  meta.set_simulated(true);

  auto result = computer_->Compute(meta);

  const double elapsed_ms = stopwatch.ElapsedMs();
  span.SetAttribute("mag", params.mag);
  span.SetAttribute("elapsed_ms", elapsed_ms);
  observability::Metrics::Instance().ObserveComputeDurationMs("simulate", elapsed_ms);
  SHAKEMAP_LOG_INFO("Simulated event", {observability::DoubleField("lat", params.lat), observability::DoubleField("lon", params.lon),
                                        observability::DoubleField("depth_km", params.depth_km), observability::DoubleField("mag", params.mag),
                                        observability::DoubleField("max_mmi", result.max_mmi())});
  return result;
}

} // namespace shakemap::overlay
