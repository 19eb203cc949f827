/**
 * @file IcosahedralMesh.hpp
 * @brief Recursively refined icosahedron on the unit sphere
 *
 * Level 0 is the regular icosahedron (12 vertices, 20 faces). Each
 * refinement splits every face into 4 by its edge midpoints, projected back
 * onto the sphere, so level k has 10*4^k + 2 vertices and 20*4^k faces.
 *
 * Vertex numbering is stable across levels: the vertices of level k are the
 * first 10*4^k + 2 vertices of every finer level. Face f of level k has
 * children 4f .. 4f+3 at level k+1, which gives a face hierarchy for point
 * location.
 */

#ifndef MMWF_ICOSAHEDRAL_MESH_HPP
#define MMWF_ICOSAHEDRAL_MESH_HPP

#include "SphereGeometry.hpp"
#include <array>
#include <utility>
#include <vector>

namespace MMWF {

using Face = std::array<int, 3>;

class IcosahedralMesh {
public:
    IcosahedralMesh() = default;

    /**
     * @brief Build the mesh refined `level` times
     * @throws ConfigurationError if level < 0
     */
    static IcosahedralMesh build(int level);

    /// Expected vertex count of a level-k mesh: 10*4^k + 2
    static long long vertexCount(int level);

    int level() const { return static_cast<int>(faces_.size()) - 1; }
    int numVertices() const { return static_cast<int>(vertices_.size()); }
    int numFaces() const { return static_cast<int>(faces_.back().size()); }

    const std::vector<Vec3>& vertices() const { return vertices_; }

    /// Faces of refinement level l (0 <= l <= level())
    const std::vector<Face>& faces(int l) const { return faces_.at(l); }
    const std::vector<Face>& finestFaces() const { return faces_.back(); }

    /**
     * @brief Undirected edges (i < j) of level l, sorted and unique
     */
    std::vector<std::pair<int, int>> edges(int l) const;

    /**
     * @brief Find the finest face containing p
     *
     * Descends the face hierarchy; within a level the first containing face
     * in index order wins. `bary` receives the normalised barycentric weights
     * of the face's three vertices.
     *
     * @return finest face index, or -1 if no face contains p
     */
    int locate(const Vec3& p, std::array<double, 3>& bary) const;

private:
    bool faceContains(const Face& f, const Vec3& p, std::array<double, 3>& bary) const;
    void refine();

    std::vector<Vec3> vertices_;
    std::vector<std::vector<Face>> faces_;
};

} // namespace MMWF

#endif // MMWF_ICOSAHEDRAL_MESH_HPP
