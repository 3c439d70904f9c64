#ifndef SENTINEL_GEO_HPP_
#define SENTINEL_GEO_HPP_

namespace sentinel {
namespace pipeline {

constexpr double kEarthRadiusKm = 6371.0;

/**
 * Great-circle distance in kilometres between two points given in degrees.
 *
 * Haversine on a sphere of radius 6371 km:
 *   a = sin^2(dphi/2) + cos(phi1) cos(phi2) sin^2(dlambda/2)
 *   d = 2 r asin(sqrt(a))
 * Inputs are not validated; NaN propagates.
 */
double haversineKm(double lat1, double lon1, double lat2, double lon2);

}  // namespace pipeline
}  // namespace sentinel

#endif  // SENTINEL_GEO_HPP_
