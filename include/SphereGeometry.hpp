/**
 * @file SphereGeometry.hpp
 * @brief Unit-sphere helpers shared by the mesh and graph builders
 *
 * Latitude/longitude are in degrees throughout; positions are unit vectors
 * with z pointing to the north pole and x through (lat=0, lon=0).
 */

#ifndef MMWF_SPHERE_GEOMETRY_HPP
#define MMWF_SPHERE_GEOMETRY_HPP

#include <array>

namespace MMWF {

using Vec3 = std::array<double, 3>;

namespace Sphere {

constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

inline double dot(const Vec3& a, const Vec3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}

inline Vec3 sub(const Vec3& a, const Vec3& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

/// a . (b x c)
inline double tripleProduct(const Vec3& a, const Vec3& b, const Vec3& c) {
    return dot(a, cross(b, c));
}

double norm(const Vec3& a);

/// Project onto the unit sphere; throws std::invalid_argument for the zero vector
Vec3 normalize(const Vec3& a);

Vec3 latLonToUnit(double lat_deg, double lon_deg);

/// Inverse of latLonToUnit; longitude returned in [0, 360)
void unitToLatLon(const Vec3& p, double& lat_deg, double& lon_deg);

/// Great-circle distance between unit vectors, in radians
double greatCircleDistance(const Vec3& a, const Vec3& b);

/**
 * @brief Rotate p by Rz(-lon) then Ry(lat) of the receiver
 *
 * The receiver itself maps to (1, 0, 0), so relative displacements expressed
 * in this frame do not depend on where on the globe the receiver sits.
 */
Vec3 toReceiverFrame(const Vec3& p, double recv_lat_deg, double recv_lon_deg);

} // namespace Sphere
} // namespace MMWF

#endif // MMWF_SPHERE_GEOMETRY_HPP
