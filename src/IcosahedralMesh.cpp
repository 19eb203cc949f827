/**
 * @file IcosahedralMesh.cpp
 * @brief Icosahedron construction, refinement and point location
 */

#include "IcosahedralMesh.hpp"
#include "ForecastErrors.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace MMWF {

namespace {

// Tolerance on the (unnormalised) triple products used for containment
constexpr double CONTAINS_TOL = 1e-12;

} // namespace

long long IcosahedralMesh::vertexCount(int level) {
    long long n = 10;
    for (int k = 0; k < level; ++k) n *= 4;
    return n + 2;
}

IcosahedralMesh IcosahedralMesh::build(int level) {
    if (level < 0) {
        throw ConfigurationError("mesh refinement level must be >= 0, got " +
                                 std::to_string(level));
    }

    IcosahedralMesh mesh;

    // Golden ratio for icosahedron vertex positioning
    const double phi = (1.0 + std::sqrt(5.0)) / 2.0;

    const Vec3 base[12] = {
        {-1.0,  phi,  0.0}, { 1.0,  phi,  0.0}, {-1.0, -phi,  0.0}, { 1.0, -phi,  0.0},
        { 0.0, -1.0,  phi}, { 0.0,  1.0,  phi}, { 0.0, -1.0, -phi}, { 0.0,  1.0, -phi},
        { phi,  0.0, -1.0}, { phi,  0.0,  1.0}, {-phi,  0.0, -1.0}, {-phi,  0.0,  1.0}
    };
    for (const Vec3& v : base) {
        mesh.vertices_.push_back(Sphere::normalize(v));
    }

    mesh.faces_.push_back({
        {0, 11, 5}, {0, 5, 1}, {0, 1, 7}, {0, 7, 10}, {0, 10, 11},
        {1, 5, 9}, {5, 11, 4}, {11, 10, 2}, {10, 7, 6}, {7, 1, 8},
        {3, 9, 4}, {3, 4, 2}, {3, 2, 6}, {3, 6, 8}, {3, 8, 9},
        {4, 9, 5}, {2, 4, 11}, {6, 2, 10}, {8, 6, 7}, {9, 8, 1}
    });

    for (int k = 0; k < level; ++k) {
        mesh.refine();
    }

    return mesh;
}

void IcosahedralMesh::refine() {
    const std::vector<Face>& coarse = faces_.back();
    std::vector<Face> fine;
    fine.reserve(coarse.size() * 4);

    std::map<std::pair<int, int>, int> midpoint_cache;
    auto midpoint = [&](int i, int j) {
        std::pair<int, int> key(std::min(i, j), std::max(i, j));
        auto it = midpoint_cache.find(key);
        if (it != midpoint_cache.end()) return it->second;

        const Vec3& a = vertices_[i];
        const Vec3& b = vertices_[j];
        vertices_.push_back(Sphere::normalize({a[0] + b[0], a[1] + b[1], a[2] + b[2]}));
        int idx = static_cast<int>(vertices_.size()) - 1;
        midpoint_cache[key] = idx;
        return idx;
    };

    for (const Face& f : coarse) {
        const int v0 = f[0], v1 = f[1], v2 = f[2];
        const int a = midpoint(v0, v1);
        const int b = midpoint(v1, v2);
        const int c = midpoint(v2, v0);

        // Children 4f .. 4f+3
        fine.push_back({v0, a, c});
        fine.push_back({v1, b, a});
        fine.push_back({v2, c, b});
        fine.push_back({a, b, c});
    }

    faces_.push_back(std::move(fine));
}

std::vector<std::pair<int, int>> IcosahedralMesh::edges(int l) const {
    std::vector<std::pair<int, int>> result;
    const auto& level_faces = faces_.at(l);
    result.reserve(level_faces.size() * 3);

    for (const Face& f : level_faces) {
        for (int k = 0; k < 3; ++k) {
            int i = f[k], j = f[(k + 1) % 3];
            result.emplace_back(std::min(i, j), std::max(i, j));
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

bool IcosahedralMesh::faceContains(const Face& f, const Vec3& p,
                                   std::array<double, 3>& bary) const {
    const Vec3& a = vertices_[f[0]];
    const Vec3& b = vertices_[f[1]];
    const Vec3& c = vertices_[f[2]];

    // Orientation of the face as seen from outside, so winding does not matter
    const double orient = Sphere::tripleProduct(a, b, c) > 0.0 ? 1.0 : -1.0;

    double wa = orient * Sphere::tripleProduct(p, b, c);
    double wb = orient * Sphere::tripleProduct(a, p, c);
    double wc = orient * Sphere::tripleProduct(a, b, p);

    if (wa < -CONTAINS_TOL || wb < -CONTAINS_TOL || wc < -CONTAINS_TOL) {
        return false;
    }

    wa = std::max(wa, 0.0);
    wb = std::max(wb, 0.0);
    wc = std::max(wc, 0.0);
    double total = wa + wb + wc;
    if (total <= 0.0) {
        return false;
    }

    bary = {wa / total, wb / total, wc / total};
    return true;
}

int IcosahedralMesh::locate(const Vec3& p, std::array<double, 3>& bary) const {
    int face = -1;
    for (int f = 0; f < static_cast<int>(faces_[0].size()); ++f) {
        if (faceContains(faces_[0][f], p, bary)) {
            face = f;
            break;
        }
    }
    if (face < 0) return -1;

    for (int l = 1; l < static_cast<int>(faces_.size()); ++l) {
        int found = -1;
        for (int child = 4 * face; child < 4 * face + 4; ++child) {
            if (faceContains(faces_[l][child], p, bary)) {
                found = child;
                break;
            }
        }
        if (found < 0) {
            // Rounding at a parent boundary: fall back to a scan of the finest level
            const auto& finest = faces_.back();
            for (int f = 0; f < static_cast<int>(finest.size()); ++f) {
                if (faceContains(finest[f], p, bary)) return f;
            }
            return -1;
        }
        face = found;
    }

    return face;
}

} // namespace MMWF
