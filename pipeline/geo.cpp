#include "pipeline/geo.hpp"

#include <cmath>

namespace sentinel {
namespace pipeline {

namespace {

constexpr double kPi = 3.14159265358979323846;

double radians(double degrees) {
  return degrees * (kPi / 180.0);
}

}  // namespace

double haversineKm(double lat1, double lon1, double lat2, double lon2) {
  const double phi1 = radians(lat1);
  const double phi2 = radians(lat2);
  const double dphi = radians(lat2 - lat1);
  const double dlambda = radians(lon2 - lon1);

  const double sin_dphi = std::sin(dphi / 2.0);
  const double sin_dlambda = std::sin(dlambda / 2.0);
  const double a = sin_dphi * sin_dphi +
                   std::cos(phi1) * std::cos(phi2) * sin_dlambda * sin_dlambda;
  return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(a));
}

}  // namespace pipeline
}  // namespace sentinel
