/**
 * @file SphereGeometry.cpp
 * @brief Implementation of unit-sphere helpers
 */

#include "SphereGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace MMWF {
namespace Sphere {

double norm(const Vec3& a) {
    return std::sqrt(dot(a, a));
}

Vec3 normalize(const Vec3& a) {
    double n = norm(a);
    if (n == 0.0) {
        throw std::invalid_argument("Sphere::normalize: zero vector");
    }
    return {a[0] / n, a[1] / n, a[2] / n};
}

Vec3 latLonToUnit(double lat_deg, double lon_deg) {
    double lat = lat_deg * DEG_TO_RAD;
    double lon = lon_deg * DEG_TO_RAD;
    return {std::cos(lat) * std::cos(lon),
            std::cos(lat) * std::sin(lon),
            std::sin(lat)};
}

void unitToLatLon(const Vec3& p, double& lat_deg, double& lon_deg) {
    double z = std::max(-1.0, std::min(1.0, p[2]));
    lat_deg = std::asin(z) * RAD_TO_DEG;
    lon_deg = std::atan2(p[1], p[0]) * RAD_TO_DEG;
    if (lon_deg < 0.0) lon_deg += 360.0;
}

double greatCircleDistance(const Vec3& a, const Vec3& b) {
    // atan2 form stays accurate for both tiny and near-antipodal separations
    return std::atan2(norm(cross(a, b)), dot(a, b));
}

Vec3 toReceiverFrame(const Vec3& p, double recv_lat_deg, double recv_lon_deg) {
    double lon = recv_lon_deg * DEG_TO_RAD;
    double lat = recv_lat_deg * DEG_TO_RAD;
    double cl = std::cos(lon), sl = std::sin(lon);
    double ct = std::cos(lat), st = std::sin(lat);

    // Rz(-lon)
    double x1 = cl * p[0] + sl * p[1];
    double y1 = -sl * p[0] + cl * p[1];
    double z1 = p[2];

    // Ry(lat)
    return {ct * x1 + st * z1, y1, -st * x1 + ct * z1};
}

} // namespace Sphere
} // namespace MMWF
