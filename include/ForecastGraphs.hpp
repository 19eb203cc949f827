/**
 * @file ForecastGraphs.hpp
 * @brief Static graphs of the multi-mesh forecaster
 *
 * Three graphs are built once per configuration and shared read-only by the
 * encoder, processor and decoder:
 * - Mesh: directed edges between adjacent icosahedral mesh vertices
 * - Grid2Mesh: grid node -> every mesh node within a geodesic radius
 * - Mesh2Grid: the three vertices of the enclosing mesh triangle -> grid node
 *
 * All edge sets carry 4 geometric features [|d|, dx, dy, dz] / max|d| where d
 * is sender minus receiver expressed in the receiver-local frame, and a
 * per-edge aggregation weight (1 except for Mesh2Grid).
 */

#ifndef MMWF_FORECAST_GRAPHS_HPP
#define MMWF_FORECAST_GRAPHS_HPP

#include "IcosahedralMesh.hpp"
#include "SphereGeometry.hpp"
#include "Tensor.hpp"
#include <memory>
#include <vector>

namespace MMWF {

/// Number of geometric features carried by every edge
constexpr int EDGE_FEATURE_DIM = 4;

/// Number of structural node features: cos(lat), sin(lon), cos(lon)
constexpr int NODE_STRUCTURAL_DIM = 3;

// =============================================================================
// Build parameters
// =============================================================================

struct GraphBuildConfig {
    int mesh_size = 5;                              // Refinement level
    bool multimesh = true;                          // Union of all levels' edges
    double radius_query_fraction_edge_length = 0.6;
    double mesh2grid_edge_normalization_factor = 0.6180338738074472;
    double resolution = 1.0;                        // Regular grid spacing [deg]

    // Explicit grid points; when set they replace the regular grid
    std::vector<double> grid_latitudes;
    std::vector<double> grid_longitudes;
};

// =============================================================================
// Node sets
// =============================================================================

/**
 * @brief Latitude-longitude grid nodes
 *
 * A regular grid of resolution r has 180/r + 1 latitudes from -90 to 90 and
 * 360/r longitudes from 0; node index = lat_index * n_lon + lon_index.
 */
struct LatLonGrid {
    std::vector<double> lat;        // [deg]
    std::vector<double> lon;        // [deg]
    std::vector<Vec3> positions;    // Unit vectors
    int n_lat = 0;                  // 0 for explicit point lists
    int n_lon = 0;

    int numNodes() const { return static_cast<int>(positions.size()); }

    /// @throws ConfigurationError unless 180/r and 360/r are integers
    static LatLonGrid regular(double resolution_deg);

    /// @throws ConfigurationError for empty/mismatched lists or |lat| > 90
    static LatLonGrid fromPoints(const std::vector<double>& lat_deg,
                                 const std::vector<double>& lon_deg);

    /// Node count of a regular grid (0 for an invalid resolution)
    static long long regularCount(double resolution_deg);

    /// [N, 3] cos(lat), sin(lon), cos(lon)
    ML::Tensor structuralFeatures() const;
};

// =============================================================================
// Edge sets
// =============================================================================

/**
 * @brief Directed edges with static features and a receiver incidence
 *
 * The incidence lists, for every receiver, its incoming edge ids in
 * increasing order; aggregation walks it so that sums are independent of
 * thread scheduling.
 */
struct EdgeSet {
    int num_senders = 0;
    int num_receivers = 0;

    std::vector<int> senders;
    std::vector<int> receivers;
    ML::Tensor features;            // [E, EDGE_FEATURE_DIM]
    std::vector<double> weights;    // [E]

    std::vector<int> recv_offsets;  // [num_receivers + 1]
    std::vector<int> recv_edges;    // [E]

    int numEdges() const { return static_cast<int>(senders.size()); }

    /// Edges arriving at receiver r: recv_edges[recv_offsets[r] .. recv_offsets[r+1])
    int inDegree(int r) const { return recv_offsets[r + 1] - recv_offsets[r]; }

    void buildIncidence();
};

/**
 * @brief Icosahedral mesh nodes and (multi-)mesh edges
 */
struct MeshGraph {
    IcosahedralMesh icosphere;
    std::vector<double> lat;
    std::vector<double> lon;
    ML::Tensor structural;          // [M, 3]
    EdgeSet edges;
    bool multimesh = true;
    double max_finest_edge_arc = 0.0;  // [rad]

    int numNodes() const { return icosphere.numVertices(); }
    const std::vector<Vec3>& positions() const { return icosphere.vertices(); }

    /**
     * @brief Placeholder node input of width `dim`
     *
     * The first min(3, dim) columns hold the structural features, the rest
     * are zero.
     */
    ML::Tensor placeholderFeatures(int dim) const;
};

/**
 * @brief The complete static graph bundle
 */
struct ForecastGraphs {
    LatLonGrid grid;
    MeshGraph mesh;
    EdgeSet grid2mesh;   // senders: grid, receivers: mesh
    EdgeSet mesh2grid;   // senders: mesh, receivers: grid

    int numGridNodes() const { return grid.numNodes(); }
    int numMeshNodes() const { return mesh.numNodes(); }

    /**
     * @brief Check node counts, edge endpoints and incidence consistency
     * @throws ConfigurationError describing the first violation
     */
    void validate() const;

    void summary() const;
};

// =============================================================================
// Graph Builder
// =============================================================================

class GraphBuilder {
public:
    /**
     * @brief Mesh graph at refinement `level`, both directions of each edge
     *
     * With multimesh the edge set is the union over levels 0..level; edges
     * are unique and sorted by (sender, receiver).
     */
    static MeshGraph buildMeshGraph(int level, bool multimesh);

    /**
     * @brief Grid -> mesh edges within radius_fraction * max finest-mesh edge arc
     * @throws ConfigurationError if a grid node receives no mesh node
     */
    static EdgeSet buildGrid2Mesh(const LatLonGrid& grid, const MeshGraph& mesh,
                                  double radius_fraction);

    /**
     * @brief Enclosing-triangle mesh -> grid edges, weight = barycentric * factor
     * @throws ConfigurationError if a grid node has no enclosing triangle
     */
    static EdgeSet buildMesh2Grid(const LatLonGrid& grid, const MeshGraph& mesh,
                                  double normalization_factor);

    static std::shared_ptr<const ForecastGraphs> build(const GraphBuildConfig& config,
                                                       const LatLonGrid& grid,
                                                       bool verbose = false);

    /// Build on the configured point list, or the regular grid of config.resolution
    static std::shared_ptr<const ForecastGraphs> build(const GraphBuildConfig& config,
                                                       bool verbose = false);

    /**
     * @brief Fill edges.features from node positions (receiver-local frame)
     */
    static void computeEdgeFeatures(EdgeSet& edges,
                                    const std::vector<Vec3>& sender_pos,
                                    const std::vector<Vec3>& receiver_pos,
                                    const std::vector<double>& receiver_lat,
                                    const std::vector<double>& receiver_lon);
};

} // namespace MMWF

#endif // MMWF_FORECAST_GRAPHS_HPP
