#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

#include "internal/overlay/attenuation.hpp"
#include "internal/overlay/intensity_grid.hpp"
#include "internal/overlay/simulator.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace shakemap::overlay;
using shakemap::util::ComputationError;
using shakemap::v1::EventMeta;

bool Near(double a, double b, double tolerance) {
  return std::fabs(a - b) <= tolerance;
}

EventMeta MakeMeta(double lat, double lon, double depth_km, double mag) {
  EventMeta meta;
  meta.set_time_utc("2024-03-01T12:00:00Z");
  meta.set_lat(lat);
  meta.set_lon(lon);
  meta.set_depth_km(depth_km);
  meta.set_mag(mag);
  return meta;
}

bool ComputeThrows(const IntensityGridComputer& computer, const EventMeta& meta) {
  try {
    computer.Compute(meta);
  } catch (const ComputationError&) {
    return true;
  }
  return false;
}

void TestDistances() {
  assert(Near(HaversineKm(0, 0, 1, 0), 111.195, 0.01));
  assert(Near(HaversineKm(18.0, 98.0, 18.0, 98.0), 0.0, 1e-9));
  assert(Near(HypocentralDistanceKm(30.0, 40.0), 50.0, 1e-9));
}

void TestAttenuationRelation() {
  const double expected = std::pow(10.0, 0.41 * 5.0 - std::log10(10.0 + 0.032 * std::pow(10.0, 0.41 * 5.0)) - 0.0034 * 10.0 + 1.30);
  assert(Near(PeakGroundAccelerationGal(5.0, 10.0), expected, 1e-9));

  // decays with distance, grows with magnitude
  assert(PeakGroundAccelerationGal(5.0, 50.0) < PeakGroundAccelerationGal(5.0, 10.0));
  assert(PeakGroundAccelerationGal(6.0, 50.0) > PeakGroundAccelerationGal(5.0, 50.0));

  // distances below 1 km are clamped
  assert(PeakGroundAccelerationGal(5.0, 0.0) == PeakGroundAccelerationGal(5.0, 1.0));
}

void TestIntensityConversion() {
  assert(IntensityFromPga(0.0) == 1.0);
  assert(IntensityFromPga(1.0) == 1.0);
  assert(Near(IntensityFromPga(10.0), 3.2, 1e-9));
  assert(Near(IntensityFromPga(100.0), 5.7, 1e-9));
  assert(IntensityFromPga(1e5) == 10.0);
}

void TestGridShapeAndPeak() {
  IntensityGridComputer computer({1.0, 0.5});
  const auto            result = computer.Compute(MakeMeta(15.0, 100.0, 10.0, 6.0));

  assert(result.meta().lat() == 15.0);
  assert(result.grid().rows() == 5);
  assert(result.grid().cols() == 5);
  assert(result.grid().mmi_size() == 25);
  assert(result.grid().pga_gal_size() == 25);
  assert(Near(result.bounds().south(), 14.0, 1e-9));
  assert(Near(result.bounds().north(), 16.0, 1e-9));
  assert(Near(result.bounds().west(), 99.0, 1e-9));
  assert(Near(result.bounds().east(), 101.0, 1e-9));

  // the epicentre node is the strongest
  const double centre = result.grid().mmi(12);
  for (double mmi : result.grid().mmi()) {
    assert(mmi <= centre);
    assert(mmi >= 1.0 && mmi <= 10.0);
  }
  assert(result.max_mmi() == centre);
  assert(Near(result.max_pga_gal(), result.grid().pga_gal(12), 0.01));

  assert(result.legend_size() == 9);
  assert(result.legend(0).label() == "I");
  assert(result.legend(8).label() == "X+");
  assert(!result.computed_at().empty());
}

void TestAreasAreNestedByLevel() {
  IntensityGridComputer computer({2.0, 0.1});
  const auto            result = computer.Compute(MakeMeta(15.0, 100.0, 10.0, 6.5));

  assert(result.areas_size() > 0);
  assert(result.areas(0).mmi() == 2);
  for (int i = 1; i < result.areas_size(); ++i) {
    assert(result.areas(i).mmi() == result.areas(i - 1).mmi() + 1);
    assert(result.areas(i).area_km2() <= result.areas(i - 1).area_km2());
  }
}

void TestInvalidEventsAreRejected() {
  IntensityGridComputer computer({1.0, 0.5});
  assert(ComputeThrows(computer, MakeMeta(91.0, 100.0, 10.0, 5.0)));
  assert(ComputeThrows(computer, MakeMeta(15.0, 181.0, 10.0, 5.0)));
  assert(ComputeThrows(computer, MakeMeta(15.0, 100.0, -1.0, 5.0)));
  assert(ComputeThrows(computer, MakeMeta(15.0, 100.0, 701.0, 5.0)));
  assert(ComputeThrows(computer, MakeMeta(15.0, 100.0, 10.0, 0.0)));
  assert(ComputeThrows(computer, MakeMeta(15.0, 100.0, 10.0, std::numeric_limits<double>::quiet_NaN())));

  EventMeta missing;
  missing.set_lat(15.0);
  assert(ComputeThrows(computer, missing));
}

void TestInvalidGridOptionsAreRejected() {
  bool threw = false;
  try {
    IntensityGridComputer computer({0.1, 0.5});
  } catch (const ComputationError&) {
    threw = true;
  }
  assert(threw);
}

void TestSimulatorStampsSyntheticEvent() {
  auto      computer = std::make_shared<const IntensityGridComputer>(GridOptions{1.0, 0.5});
  Simulator simulator(computer);

  const auto result = simulator.Simulate({13.75, 100.5, 15.0, 5.5});
  assert(result.meta().simulated());
  assert(result.meta().source() == "simulation");
  assert(result.meta().lat() == 13.75);
  assert(result.meta().depth_km() == 15.0);
  assert(result.meta().mag() == 5.5);
  assert(!result.meta().time_utc().empty());
  assert(!result.meta().time_th().empty());

  bool threw = false;
  try {
    simulator.Simulate({13.75, 100.5, 15.0, 11.0});
  } catch (const ComputationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDistances();
  TestAttenuationRelation();
  TestIntensityConversion();
  TestGridShapeAndPeak();
  TestAreasAreNestedByLevel();
  TestInvalidEventsAreRejected();
  TestInvalidGridOptionsAreRejected();
  TestSimulatorStampsSyntheticEvent();

  std::cout << "shakemap_unit_overlay: pass\n";
  return 0;
}
