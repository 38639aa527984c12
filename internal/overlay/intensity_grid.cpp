#include "intensity_grid.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "attenuation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace shakemap::overlay {

using shakemap::v1::EventMeta;
using shakemap::v1::ShakemapResult;

namespace {

constexpr double kKmPerDegree = 111.195;
constexpr double kMaxDepthKm  = 700.0;
constexpr double kMaxMag      = 10.0;

struct LegendRow {
  int         mmi;
  const char* label;
  const char* color;
  const char* shaking;
};

// USGS ShakeMap intensity scale
constexpr std::array<LegendRow, 9> kLegend = {{
    {1, "I", "#FFFFFF", "Not felt"},
    {2, "II-III", "#BFCCFF", "Weak"},
    {4, "IV", "#A0E6FF", "Light"},
    {5, "V", "#80FFFF", "Moderate"},
    {6, "VI", "#7AFF93", "Strong"},
    {7, "VII", "#FFFF00", "Very strong"},
    {8, "VIII", "#FFC800", "Severe"},
    {9, "IX", "#FF9100", "Violent"},
    {10, "X+", "#FF0000", "Extreme"},
}};

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::ComputationError(message);
  }
}

int Steps(double span, double spacing) {
  return static_cast<int>(std::floor(span / spacing + 1e-9));
}

} // namespace

void ValidateEventMeta(const EventMeta& meta) {
  Require(meta.has_lat() && meta.has_lon() && meta.has_mag() && meta.has_depth_km(), "event metadata is missing lat/lon/mag/depth_km");
  Require(std::isfinite(meta.lat()) && meta.lat() >= -90.0 && meta.lat() <= 90.0, "latitude out of range [-90, 90]");
  Require(std::isfinite(meta.lon()) && meta.lon() >= -180.0 && meta.lon() <= 180.0, "longitude out of range [-180, 180]");
  Require(std::isfinite(meta.depth_km()) && meta.depth_km() >= 0.0 && meta.depth_km() <= kMaxDepthKm, "depth out of range [0, 700] km");
  Require(std::isfinite(meta.mag()) && meta.mag() > 0.0 && meta.mag() <= kMaxMag, "magnitude out of range (0, 10]");
}

IntensityGridComputer::IntensityGridComputer(GridOptions options) : options_(options) {
  Require(options_.spacing_deg > 0 && options_.half_width_deg >= options_.spacing_deg, "invalid grid options");
}

ShakemapResult IntensityGridComputer::Compute(const EventMeta& meta) const {
  ValidateEventMeta(meta);

  const double spacing = options_.spacing_deg;
  const double south   = std::max(-90.0, meta.lat() - options_.half_width_deg);
  const double north   = std::min(90.0, meta.lat() + options_.half_width_deg);
  const double west    = meta.lon() - options_.half_width_deg;
  const double east    = meta.lon() + options_.half_width_deg;
  const int    rows    = Steps(north - south, spacing) + 1;
  const int    cols    = Steps(east - west, spacing) + 1;

  ShakemapResult result;
  *result.mutable_meta() = meta;

  auto* grid = result.mutable_grid();
  grid->set_rows(rows);
  grid->set_cols(cols);
  grid->set_spacing_deg(spacing);
  grid->mutable_mmi()->Reserve(rows * cols);
  grid->mutable_pga_gal()->Reserve(rows * cols);

  auto* bounds = grid->mutable_bounds();
  bounds->set_south(south);
  bounds->set_west(west);
  bounds->set_north(south + (rows - 1) * spacing);
  bounds->set_east(west + (cols - 1) * spacing);
  *result.mutable_bounds() = *bounds;

  // area_by_level[k] accumulates cells with MMI >= k
  std::array<double, 11> area_by_level{};
  double                 max_mmi = 1.0;
  double                 max_pga = 0.0;

  for (int r = 0; r < rows; ++r) {
    const double lat       = south + r * spacing;
    const double cell_area = std::pow(spacing * kKmPerDegree, 2) * std::cos(lat * 3.14159265358979323846 / 180.0);

    for (int c = 0; c < cols; ++c) {
      const double lon  = west + c * spacing;
      const double dist = HypocentralDistanceKm(HaversineKm(meta.lat(), meta.lon(), lat, lon), meta.depth_km());
      const double pga  = PeakGroundAccelerationGal(meta.mag(), dist);
      const double mmi  = IntensityFromPga(pga);

      grid->add_pga_gal(std::round(pga * 100.0) / 100.0);
      grid->add_mmi(mmi);

      max_mmi = std::max(max_mmi, mmi);
      max_pga = std::max(max_pga, pga);
      for (int level = 2; level <= static_cast<int>(mmi); ++level) {
        area_by_level[level] += cell_area;
      }
    }
  }

  result.set_max_mmi(max_mmi);
  result.set_max_pga_gal(std::round(max_pga * 100.0) / 100.0);

  for (int level = 2; level <= 10; ++level) {
    if (area_by_level[level] <= 0) {
      break;
    }
    auto* area = result.add_areas();
    area->set_mmi(level);
    area->set_area_km2(std::round(area_by_level[level]));
  }

  for (const auto& row : kLegend) {
    auto* entry = result.add_legend();
    entry->set_mmi(row.mmi);
    entry->set_label(row.label);
    entry->set_color(row.color);
    entry->set_shaking(row.shaking);
  }

  result.set_computed_at(util::FormatUtc(util::Now()));
  return result;
}

} // namespace shakemap::overlay
