/**
 * @file ForecastGraphs.cpp
 * @brief Construction and validation of the grid, mesh and coupling graphs
 */

#include "ForecastGraphs.hpp"
#include "ForecastErrors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace MMWF {

namespace {

bool isWholeNumber(double x) {
    return std::abs(x - std::round(x)) < 1e-9;
}

/**
 * @brief Uniform bucket index over [-1, 1]^3 for radius queries on the sphere
 */
class BucketIndex {
public:
    BucketIndex(const std::vector<Vec3>& points, double cell_size)
        : points_(points) {
        n_ = std::max(1, std::min(64, static_cast<int>(std::floor(2.0 / cell_size))));
        cell_ = 2.0 / n_;
        buckets_.resize(static_cast<size_t>(n_) * n_ * n_);
        for (int i = 0; i < static_cast<int>(points.size()); ++i) {
            buckets_[key(cellOf(points[i][0]), cellOf(points[i][1]), cellOf(points[i][2]))]
                .push_back(i);
        }
    }

    /// Indices within chord distance `chord` of p, sorted ascending
    std::vector<int> query(const Vec3& p, double chord) const {
        std::vector<int> result;
        const int cx = cellOf(p[0]), cy = cellOf(p[1]), cz = cellOf(p[2]);
        const double chord2 = chord * chord;

        for (int ix = std::max(0, cx - 1); ix <= std::min(n_ - 1, cx + 1); ++ix) {
            for (int iy = std::max(0, cy - 1); iy <= std::min(n_ - 1, cy + 1); ++iy) {
                for (int iz = std::max(0, cz - 1); iz <= std::min(n_ - 1, cz + 1); ++iz) {
                    for (int idx : buckets_[key(ix, iy, iz)]) {
                        Vec3 d = Sphere::sub(points_[idx], p);
                        if (Sphere::dot(d, d) <= chord2) {
                            result.push_back(idx);
                        }
                    }
                }
            }
        }

        std::sort(result.begin(), result.end());
        return result;
    }

private:
    int cellOf(double x) const {
        int c = static_cast<int>(std::floor((x + 1.0) / cell_));
        return std::max(0, std::min(n_ - 1, c));
    }

    size_t key(int ix, int iy, int iz) const {
        return (static_cast<size_t>(ix) * n_ + iy) * n_ + iz;
    }

    const std::vector<Vec3>& points_;
    int n_;
    double cell_;
    std::vector<std::vector<int>> buckets_;
};

void requireEndpoints(const EdgeSet& edges, const std::string& name) {
    const int n = edges.numEdges();
    if (static_cast<int>(edges.receivers.size()) != n ||
        static_cast<int>(edges.weights.size()) != n) {
        throw ConfigurationError(name + ": edge arrays have inconsistent lengths");
    }
    if (edges.features.rows() != n || edges.features.cols() != EDGE_FEATURE_DIM) {
        throw ConfigurationError(name + ": edge features have shape " +
                                 edges.features.shapeString());
    }
    for (int e = 0; e < n; ++e) {
        if (edges.senders[e] < 0 || edges.senders[e] >= edges.num_senders ||
            edges.receivers[e] < 0 || edges.receivers[e] >= edges.num_receivers) {
            throw ConfigurationError(name + ": edge " + std::to_string(e) +
                                     " references a node that does not exist");
        }
    }
    if (static_cast<int>(edges.recv_offsets.size()) != edges.num_receivers + 1 ||
        static_cast<int>(edges.recv_edges.size()) != n ||
        edges.recv_offsets.back() != n) {
        throw ConfigurationError(name + ": receiver incidence is stale");
    }
}

} // namespace

// =============================================================================
// LatLonGrid
// =============================================================================

long long LatLonGrid::regularCount(double resolution_deg) {
    if (!(resolution_deg > 0.0)) return 0;
    double nlat = 180.0 / resolution_deg;
    double nlon = 360.0 / resolution_deg;
    if (!isWholeNumber(nlat) || !isWholeNumber(nlon)) return 0;
    return (std::llround(nlat) + 1) * std::llround(nlon);
}

LatLonGrid LatLonGrid::regular(double resolution_deg) {
    if (regularCount(resolution_deg) == 0) {
        std::ostringstream ss;
        ss << "grid resolution " << resolution_deg << " deg does not divide 180 and 360";
        throw ConfigurationError(ss.str());
    }

    LatLonGrid grid;
    grid.n_lat = static_cast<int>(std::llround(180.0 / resolution_deg)) + 1;
    grid.n_lon = static_cast<int>(std::llround(360.0 / resolution_deg));

    const int n = grid.n_lat * grid.n_lon;
    grid.lat.resize(n);
    grid.lon.resize(n);
    grid.positions.resize(n);

    for (int i = 0; i < grid.n_lat; ++i) {
        double la = -90.0 + i * resolution_deg;
        for (int j = 0; j < grid.n_lon; ++j) {
            int idx = i * grid.n_lon + j;
            grid.lat[idx] = la;
            grid.lon[idx] = j * resolution_deg;
            grid.positions[idx] = Sphere::latLonToUnit(la, grid.lon[idx]);
        }
    }
    return grid;
}

LatLonGrid LatLonGrid::fromPoints(const std::vector<double>& lat_deg,
                                  const std::vector<double>& lon_deg) {
    if (lat_deg.empty()) {
        throw ConfigurationError("grid has no nodes");
    }
    if (lat_deg.size() != lon_deg.size()) {
        throw ConfigurationError("grid latitude and longitude lists differ in length");
    }

    LatLonGrid grid;
    grid.lat = lat_deg;
    grid.lon = lon_deg;
    grid.positions.reserve(lat_deg.size());
    for (size_t i = 0; i < lat_deg.size(); ++i) {
        if (!(lat_deg[i] >= -90.0 && lat_deg[i] <= 90.0) || !std::isfinite(lon_deg[i])) {
            std::ostringstream ss;
            ss << "grid node " << i << " has invalid coordinates (" << lat_deg[i]
               << ", " << lon_deg[i] << ")";
            throw ConfigurationError(ss.str());
        }
        grid.positions.push_back(Sphere::latLonToUnit(lat_deg[i], lon_deg[i]));
    }
    return grid;
}

ML::Tensor LatLonGrid::structuralFeatures() const {
    const int n = numNodes();
    ML::Tensor f({n, NODE_STRUCTURAL_DIM});
    for (int i = 0; i < n; ++i) {
        f(i, 0) = std::cos(lat[i] * Sphere::DEG_TO_RAD);
        f(i, 1) = std::sin(lon[i] * Sphere::DEG_TO_RAD);
        f(i, 2) = std::cos(lon[i] * Sphere::DEG_TO_RAD);
    }
    return f;
}

// =============================================================================
// EdgeSet / MeshGraph
// =============================================================================

void EdgeSet::buildIncidence() {
    const int n = numEdges();
    recv_offsets.assign(num_receivers + 1, 0);
    for (int e = 0; e < n; ++e) {
        recv_offsets[receivers[e] + 1]++;
    }
    for (int r = 0; r < num_receivers; ++r) {
        recv_offsets[r + 1] += recv_offsets[r];
    }

    // Stable counting sort keeps edge ids ascending within a receiver
    recv_edges.assign(n, 0);
    std::vector<int> cursor(recv_offsets.begin(), recv_offsets.end() - 1);
    for (int e = 0; e < n; ++e) {
        recv_edges[cursor[receivers[e]]++] = e;
    }
}

ML::Tensor MeshGraph::placeholderFeatures(int dim) const {
    const int n = numNodes();
    ML::Tensor f({n, dim}, 0.0);
    const int k = std::min(NODE_STRUCTURAL_DIM, dim);
    for (int i = 0; i < n; ++i) {
        for (int c = 0; c < k; ++c) {
            f(i, c) = structural(i, c);
        }
    }
    return f;
}

// =============================================================================
// ForecastGraphs
// =============================================================================

void ForecastGraphs::validate() const {
    const int level = mesh.icosphere.level();
    if (level < 0) {
        throw ConfigurationError("mesh graph has not been built");
    }
    if (mesh.numNodes() != IcosahedralMesh::vertexCount(level)) {
        throw ConfigurationError("mesh has " + std::to_string(mesh.numNodes()) +
                                 " nodes, expected " +
                                 std::to_string(IcosahedralMesh::vertexCount(level)));
    }
    if (grid.numNodes() == 0) {
        throw ConfigurationError("grid has no nodes");
    }

    if (mesh.edges.num_senders != mesh.numNodes() ||
        mesh.edges.num_receivers != mesh.numNodes()) {
        throw ConfigurationError("mesh edges: node counts do not match the mesh");
    }
    if (grid2mesh.num_senders != grid.numNodes() ||
        grid2mesh.num_receivers != mesh.numNodes()) {
        throw ConfigurationError("grid2mesh edges: node counts do not match the graphs");
    }
    if (mesh2grid.num_senders != mesh.numNodes() ||
        mesh2grid.num_receivers != grid.numNodes()) {
        throw ConfigurationError("mesh2grid edges: node counts do not match the graphs");
    }

    requireEndpoints(mesh.edges, "mesh edges");
    requireEndpoints(grid2mesh, "grid2mesh edges");
    requireEndpoints(mesh2grid, "mesh2grid edges");

    for (int g = 0; g < grid.numNodes(); ++g) {
        if (mesh2grid.inDegree(g) != 3) {
            throw ConfigurationError("grid node " + std::to_string(g) +
                                     " is not covered by exactly one mesh triangle");
        }
    }
}

void ForecastGraphs::summary() const {
    std::cout << "Forecast graphs\n";
    std::cout << "  Grid nodes:      " << grid.numNodes();
    if (grid.n_lat > 0) std::cout << " (" << grid.n_lat << " x " << grid.n_lon << ")";
    std::cout << "\n";
    std::cout << "  Mesh level:      " << mesh.icosphere.level()
              << (mesh.multimesh ? " (multi-mesh)" : "") << "\n";
    std::cout << "  Mesh nodes:      " << mesh.numNodes() << "\n";
    std::cout << "  Mesh edges:      " << mesh.edges.numEdges() << "\n";
    std::cout << "  Grid2Mesh edges: " << grid2mesh.numEdges() << "\n";
    std::cout << "  Mesh2Grid edges: " << mesh2grid.numEdges() << "\n";
}

// =============================================================================
// GraphBuilder
// =============================================================================

void GraphBuilder::computeEdgeFeatures(EdgeSet& edges,
                                       const std::vector<Vec3>& sender_pos,
                                       const std::vector<Vec3>& receiver_pos,
                                       const std::vector<double>& receiver_lat,
                                       const std::vector<double>& receiver_lon) {
    const int n = edges.numEdges();
    edges.features = ML::Tensor({n, EDGE_FEATURE_DIM});

    #pragma omp parallel for
    for (int e = 0; e < n; ++e) {
        const int s = edges.senders[e];
        const int r = edges.receivers[e];
        Vec3 ps = Sphere::toReceiverFrame(sender_pos[s], receiver_lat[r], receiver_lon[r]);
        Vec3 pr = Sphere::toReceiverFrame(receiver_pos[r], receiver_lat[r], receiver_lon[r]);
        Vec3 d = Sphere::sub(ps, pr);
        double* f = edges.features.row(e);
        f[0] = Sphere::norm(d);
        f[1] = d[0];
        f[2] = d[1];
        f[3] = d[2];
    }

    double max_len = 0.0;
    for (int e = 0; e < n; ++e) {
        max_len = std::max(max_len, edges.features(e, 0));
    }
    if (n > 0 && max_len <= 0.0) {
        throw ConfigurationError("all edges have zero length");
    }
    if (n > 0) {
        for (double& x : edges.features.data) x /= max_len;
    }
}

MeshGraph GraphBuilder::buildMeshGraph(int level, bool multimesh) {
    MeshGraph graph;
    graph.icosphere = IcosahedralMesh::build(level);
    graph.multimesh = multimesh;

    const int n = graph.numNodes();
    const auto& pos = graph.positions();

    graph.lat.resize(n);
    graph.lon.resize(n);
    graph.structural = ML::Tensor({n, NODE_STRUCTURAL_DIM});
    for (int i = 0; i < n; ++i) {
        Sphere::unitToLatLon(pos[i], graph.lat[i], graph.lon[i]);
        graph.structural(i, 0) = std::cos(graph.lat[i] * Sphere::DEG_TO_RAD);
        graph.structural(i, 1) = std::sin(graph.lon[i] * Sphere::DEG_TO_RAD);
        graph.structural(i, 2) = std::cos(graph.lon[i] * Sphere::DEG_TO_RAD);
    }

    // Longest edge of the finest level sets the Grid2Mesh query radius
    for (const auto& uv : graph.icosphere.edges(level)) {
        graph.max_finest_edge_arc = std::max(
            graph.max_finest_edge_arc,
            Sphere::greatCircleDistance(pos[uv.first], pos[uv.second]));
    }

    std::vector<std::pair<int, int>> directed;
    const int first_level = multimesh ? 0 : level;
    for (int l = first_level; l <= level; ++l) {
        for (const auto& uv : graph.icosphere.edges(l)) {
            directed.emplace_back(uv.first, uv.second);
            directed.emplace_back(uv.second, uv.first);
        }
    }
    std::sort(directed.begin(), directed.end());
    directed.erase(std::unique(directed.begin(), directed.end()), directed.end());

    EdgeSet& edges = graph.edges;
    edges.num_senders = n;
    edges.num_receivers = n;
    edges.senders.reserve(directed.size());
    edges.receivers.reserve(directed.size());
    for (const auto& sr : directed) {
        edges.senders.push_back(sr.first);
        edges.receivers.push_back(sr.second);
    }
    edges.weights.assign(directed.size(), 1.0);

    computeEdgeFeatures(edges, pos, pos, graph.lat, graph.lon);
    edges.buildIncidence();
    return graph;
}

EdgeSet GraphBuilder::buildGrid2Mesh(const LatLonGrid& grid, const MeshGraph& mesh,
                                     double radius_fraction) {
    if (!(radius_fraction > 0.0)) {
        throw ConfigurationError("radius_query_fraction_edge_length must be > 0");
    }
    if (grid.numNodes() == 0) {
        throw ConfigurationError("grid has no nodes");
    }

    const double radius = radius_fraction * mesh.max_finest_edge_arc;
    const double chord = 2.0 * std::sin(std::min(radius, M_PI) / 2.0);
    BucketIndex index(mesh.positions(), chord);

    const int n_grid = grid.numNodes();
    std::vector<std::vector<int>> neighbours(n_grid);

    #pragma omp parallel for
    for (int g = 0; g < n_grid; ++g) {
        std::vector<int> candidates = index.query(grid.positions[g], chord);
        for (int m : candidates) {
            if (Sphere::greatCircleDistance(grid.positions[g], mesh.positions()[m]) <= radius) {
                neighbours[g].push_back(m);
            }
        }
    }

    EdgeSet edges;
    edges.num_senders = n_grid;
    edges.num_receivers = mesh.numNodes();
    for (int g = 0; g < n_grid; ++g) {
        if (neighbours[g].empty()) {
            std::ostringstream ss;
            ss << "grid node " << g << " (" << grid.lat[g] << ", " << grid.lon[g]
               << ") has no mesh node within " << radius * Sphere::RAD_TO_DEG << " deg";
            throw ConfigurationError(ss.str());
        }
        for (int m : neighbours[g]) {
            edges.senders.push_back(g);
            edges.receivers.push_back(m);
        }
    }
    edges.weights.assign(edges.senders.size(), 1.0);

    computeEdgeFeatures(edges, grid.positions, mesh.positions(), mesh.lat, mesh.lon);
    edges.buildIncidence();
    return edges;
}

EdgeSet GraphBuilder::buildMesh2Grid(const LatLonGrid& grid, const MeshGraph& mesh,
                                     double normalization_factor) {
    if (!(normalization_factor > 0.0)) {
        throw ConfigurationError("mesh2grid_edge_normalization_factor must be > 0");
    }
    if (grid.numNodes() == 0) {
        throw ConfigurationError("grid has no nodes");
    }

    const int n_grid = grid.numNodes();
    const auto& faces = mesh.icosphere.finestFaces();

    std::vector<int> face_of(n_grid, -1);
    std::vector<std::array<double, 3>> bary(n_grid);

    #pragma omp parallel for
    for (int g = 0; g < n_grid; ++g) {
        face_of[g] = mesh.icosphere.locate(grid.positions[g], bary[g]);
    }

    EdgeSet edges;
    edges.num_senders = mesh.numNodes();
    edges.num_receivers = n_grid;
    edges.senders.reserve(3 * n_grid);
    edges.receivers.reserve(3 * n_grid);
    edges.weights.reserve(3 * n_grid);

    for (int g = 0; g < n_grid; ++g) {
        if (face_of[g] < 0) {
            std::ostringstream ss;
            ss << "grid node " << g << " (" << grid.lat[g] << ", " << grid.lon[g]
               << ") has no enclosing mesh triangle";
            throw ConfigurationError(ss.str());
        }
        const Face& f = faces[face_of[g]];
        for (int k = 0; k < 3; ++k) {
            edges.senders.push_back(f[k]);
            edges.receivers.push_back(g);
            edges.weights.push_back(bary[g][k] * normalization_factor);
        }
    }

    computeEdgeFeatures(edges, mesh.positions(), grid.positions, grid.lat, grid.lon);
    edges.buildIncidence();
    return edges;
}

std::shared_ptr<const ForecastGraphs> GraphBuilder::build(const GraphBuildConfig& config,
                                                          const LatLonGrid& grid,
                                                          bool verbose) {
    auto graphs = std::make_shared<ForecastGraphs>();
    graphs->grid = grid;
    graphs->mesh = buildMeshGraph(config.mesh_size, config.multimesh);
    graphs->grid2mesh = buildGrid2Mesh(graphs->grid, graphs->mesh,
                                       config.radius_query_fraction_edge_length);
    graphs->mesh2grid = buildMesh2Grid(graphs->grid, graphs->mesh,
                                       config.mesh2grid_edge_normalization_factor);
    graphs->validate();

    if (verbose) {
        graphs->summary();
    }
    return graphs;
}

std::shared_ptr<const ForecastGraphs> GraphBuilder::build(const GraphBuildConfig& config,
                                                          bool verbose) {
    if (!config.grid_latitudes.empty() || !config.grid_longitudes.empty()) {
        return build(config, LatLonGrid::fromPoints(config.grid_latitudes,
                                                     config.grid_longitudes), verbose);
    }
    return build(config, LatLonGrid::regular(config.resolution), verbose);
}

} // namespace MMWF
