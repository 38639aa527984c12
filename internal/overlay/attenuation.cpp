#include "attenuation.hpp"

#include <algorithm>
#include <cmath>

namespace shakemap::overlay {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

}

double HaversineKm(double lat1, double lon1, double lat2, double lon2) {
  const double dlat = (lat2 - lat1) * kDegToRad;
  const double dlon = (lon2 - lon1) * kDegToRad;
  const double a    = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(a)));
}

double HypocentralDistanceKm(double epicentral_km, double depth_km) {
  return std::hypot(epicentral_km, depth_km);
}

double PeakGroundAccelerationGal(double magnitude, double distance_km) {
  const double r     = std::max(distance_km, 1.0);
  const double log_a = 0.41 * magnitude - std::log10(r + 0.032 * std::pow(10.0, 0.41 * magnitude)) - 0.0034 * r + 1.30;
  return std::pow(10.0, log_a);
}

double IntensityFromPga(double pga_gal) {
  if (pga_gal <= 0) {
    return 1.0;
  }

  const double log_pga = std::log10(pga_gal);
  double       mmi     = 3.66 * log_pga - 1.66;
  if (mmi < 5.0) {
    mmi = 2.20 * log_pga + 1.00;
  }
  mmi = std::clamp(mmi, 1.0, 10.0);
  return std::round(mmi * 10.0) / 10.0;
}

} // namespace shakemap::overlay
