#pragma once

namespace shakemap::overlay {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance between two points, km.
double HaversineKm(double lat1, double lon1, double lat2, double lon2);

// Straight-line distance from the hypocentre to a surface point, km.
double HypocentralDistanceKm(double epicentral_km, double depth_km);

/*
  Fukushima & Tanaka (1990) mean peak ground acceleration, gal:

      log10(A) = 0.41 M - log10(R + 0.032 * 10^(0.41 M)) - 0.0034 R + 1.30
*/
double PeakGroundAccelerationGal(double magnitude, double distance_km);

/*
  Wald et al. (1999) PGA to Modified Mercalli Intensity, clamped to
  [1, 10] and rounded to one decimal.
*/
double IntensityFromPga(double pga_gal);

} // namespace shakemap::overlay
