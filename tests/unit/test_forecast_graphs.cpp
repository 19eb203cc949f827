/**
 * @file test_forecast_graphs.cpp
 * @brief Unit tests for the mesh, Grid2Mesh and Mesh2Grid graphs
 */

#include <gtest/gtest.h>
#include "ForecastGraphs.hpp"
#include "ForecastErrors.hpp"
#include <cmath>
#include <set>

using namespace MMWF;

class ForecastGraphsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.mesh_size = 2;
        config.resolution = 30.0;
    }

    static std::set<std::pair<int, int>> edgePairs(const EdgeSet& edges) {
        std::set<std::pair<int, int>> pairs;
        for (int e = 0; e < edges.numEdges(); ++e) {
            pairs.insert({edges.senders[e], edges.receivers[e]});
        }
        return pairs;
    }

    GraphBuildConfig config;
};

// =============================================================================
// Grid
// =============================================================================

TEST_F(ForecastGraphsTest, RegularGridCounts) {
    EXPECT_EQ(LatLonGrid::regularCount(1.0), 65160);
    EXPECT_EQ(LatLonGrid::regularCount(0.25), 721LL * 1440LL);
    EXPECT_EQ(LatLonGrid::regularCount(7.0), 0);
    EXPECT_EQ(LatLonGrid::regularCount(-1.0), 0);

    EXPECT_THROW(LatLonGrid::regular(7.0), ConfigurationError);
}

TEST_F(ForecastGraphsTest, RegularGridIsLatitudeMajor) {
    LatLonGrid grid = LatLonGrid::regular(30.0);
    ASSERT_EQ(grid.n_lat, 7);
    ASSERT_EQ(grid.n_lon, 12);
    ASSERT_EQ(grid.numNodes(), 84);

    int idx = 2 * grid.n_lon + 5;
    EXPECT_DOUBLE_EQ(grid.lat[idx], -30.0);
    EXPECT_DOUBLE_EQ(grid.lon[idx], 150.0);
    EXPECT_DOUBLE_EQ(grid.lat.front(), -90.0);
    EXPECT_DOUBLE_EQ(grid.lat.back(), 90.0);
}

TEST_F(ForecastGraphsTest, GridFromPointsValidation) {
    EXPECT_THROW(LatLonGrid::fromPoints({}, {}), ConfigurationError);
    EXPECT_THROW(LatLonGrid::fromPoints({0.0, 1.0}, {0.0}), ConfigurationError);
    EXPECT_THROW(LatLonGrid::fromPoints({91.0}, {0.0}), ConfigurationError);

    LatLonGrid grid = LatLonGrid::fromPoints({0.0, 60.0}, {90.0, 0.0});
    ML::Tensor f = grid.structuralFeatures();
    ASSERT_EQ(f.shape, (std::vector<int>{2, NODE_STRUCTURAL_DIM}));
    EXPECT_NEAR(f(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(f(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(f(1, 0), 0.5, 1e-12);
    EXPECT_NEAR(f(1, 2), 1.0, 1e-12);
}

// =============================================================================
// Mesh graph
// =============================================================================

TEST_F(ForecastGraphsTest, MeshEdgeCounts) {
    EXPECT_EQ(GraphBuilder::buildMeshGraph(0, true).edges.numEdges(), 60);
    EXPECT_EQ(GraphBuilder::buildMeshGraph(1, false).edges.numEdges(), 240);
    // Level-0 edges are split at level 1, so the union adds all 30 of them
    EXPECT_EQ(GraphBuilder::buildMeshGraph(1, true).edges.numEdges(), 300);
}

TEST_F(ForecastGraphsTest, MeshEdgesAreSymmetricAndSorted) {
    MeshGraph mesh = GraphBuilder::buildMeshGraph(2, true);
    const EdgeSet& edges = mesh.edges;

    auto pairs = edgePairs(edges);
    EXPECT_EQ(static_cast<int>(pairs.size()), edges.numEdges());
    for (const auto& p : pairs) {
        EXPECT_NE(p.first, p.second);
        EXPECT_TRUE(pairs.count({p.second, p.first})) << p.first << " -> " << p.second;
    }
    for (int e = 1; e < edges.numEdges(); ++e) {
        auto prev = std::make_pair(edges.senders[e - 1], edges.receivers[e - 1]);
        auto cur = std::make_pair(edges.senders[e], edges.receivers[e]);
        EXPECT_LT(prev, cur);
    }
}

TEST_F(ForecastGraphsTest, SingleLevelMeshDegrees) {
    MeshGraph mesh = GraphBuilder::buildMeshGraph(2, false);
    int five = 0, six = 0;
    for (int v = 0; v < mesh.numNodes(); ++v) {
        int d = mesh.edges.inDegree(v);
        if (d == 5) five++;
        else if (d == 6) six++;
        else ADD_FAILURE() << "vertex " << v << " has in-degree " << d;
    }
    // The original icosahedron vertices keep valence 5
    EXPECT_EQ(five, 12);
    EXPECT_EQ(six, mesh.numNodes() - 12);
}

TEST_F(ForecastGraphsTest, PlaceholderFeatures) {
    MeshGraph mesh = GraphBuilder::buildMeshGraph(1, true);

    ML::Tensor wide = mesh.placeholderFeatures(5);
    ASSERT_EQ(wide.shape, (std::vector<int>{42, 5}));
    for (int i = 0; i < mesh.numNodes(); ++i) {
        EXPECT_DOUBLE_EQ(wide(i, 0), mesh.structural(i, 0));
        EXPECT_DOUBLE_EQ(wide(i, 3), 0.0);
        EXPECT_DOUBLE_EQ(wide(i, 4), 0.0);
    }

    ML::Tensor narrow = mesh.placeholderFeatures(2);
    EXPECT_EQ(narrow.cols(), 2);
}

// =============================================================================
// Edge features and incidence
// =============================================================================

TEST_F(ForecastGraphsTest, EdgeFeatureGeometry) {
    MeshGraph mesh = GraphBuilder::buildMeshGraph(2, true);
    const ML::Tensor& f = mesh.edges.features;
    ASSERT_EQ(f.cols(), EDGE_FEATURE_DIM);

    double max_len = 0.0;
    for (int e = 0; e < mesh.edges.numEdges(); ++e) {
        double len = std::sqrt(f(e, 1) * f(e, 1) + f(e, 2) * f(e, 2) + f(e, 3) * f(e, 3));
        EXPECT_NEAR(f(e, 0), len, 1e-12);
        // The receiver sits at (1, 0, 0), so every sender lies behind it in x
        EXPECT_LE(f(e, 1), 1e-12);
        max_len = std::max(max_len, f(e, 0));
    }
    EXPECT_DOUBLE_EQ(max_len, 1.0);
}

TEST_F(ForecastGraphsTest, EdgeFeaturesOfReversedEdgesHaveEqualLength) {
    MeshGraph mesh = GraphBuilder::buildMeshGraph(1, false);
    const EdgeSet& edges = mesh.edges;

    for (int e = 0; e < edges.numEdges(); ++e) {
        for (int k = 0; k < edges.numEdges(); ++k) {
            if (edges.senders[k] == edges.receivers[e] && edges.receivers[k] == edges.senders[e]) {
                EXPECT_NEAR(edges.features(e, 0), edges.features(k, 0), 1e-12);
            }
        }
    }
}

TEST_F(ForecastGraphsTest, IncidenceListsEveryEdgeOnceInOrder) {
    auto graphs = GraphBuilder::build(config);
    for (const EdgeSet* edges : {&graphs->mesh.edges, &graphs->grid2mesh, &graphs->mesh2grid}) {
        ASSERT_EQ(static_cast<int>(edges->recv_offsets.size()), edges->num_receivers + 1);
        EXPECT_EQ(edges->recv_offsets.back(), edges->numEdges());

        std::vector<int> seen(edges->numEdges(), 0);
        for (int r = 0; r < edges->num_receivers; ++r) {
            for (int k = edges->recv_offsets[r]; k < edges->recv_offsets[r + 1]; ++k) {
                int e = edges->recv_edges[k];
                EXPECT_EQ(edges->receivers[e], r);
                if (k > edges->recv_offsets[r]) {
                    EXPECT_LT(edges->recv_edges[k - 1], e);
                }
                seen[e]++;
            }
        }
        for (int count : seen) EXPECT_EQ(count, 1);
    }
}

// =============================================================================
// Grid2Mesh / Mesh2Grid
// =============================================================================

TEST_F(ForecastGraphsTest, Grid2MeshCoversEveryGridNode) {
    auto graphs = GraphBuilder::build(config);
    const EdgeSet& g2m = graphs->grid2mesh;
    const double radius = config.radius_query_fraction_edge_length *
                          graphs->mesh.max_finest_edge_arc;

    std::vector<int> out_degree(graphs->numGridNodes(), 0);
    for (int e = 0; e < g2m.numEdges(); ++e) {
        out_degree[g2m.senders[e]]++;
        double d = Sphere::greatCircleDistance(graphs->grid.positions[g2m.senders[e]],
                                               graphs->mesh.positions()[g2m.receivers[e]]);
        EXPECT_LE(d, radius + 1e-12);
        EXPECT_DOUBLE_EQ(g2m.weights[e], 1.0);
    }
    for (int g = 0; g < graphs->numGridNodes(); ++g) {
        EXPECT_GE(out_degree[g], 1) << "grid node " << g;
    }

    // Edges are emitted grid node by grid node
    for (int e = 1; e < g2m.numEdges(); ++e) {
        EXPECT_LE(g2m.senders[e - 1], g2m.senders[e]);
    }
}

TEST_F(ForecastGraphsTest, Grid2MeshFindsEveryMeshNodeInRadius) {
    auto graphs = GraphBuilder::build(config);
    const double radius = config.radius_query_fraction_edge_length *
                          graphs->mesh.max_finest_edge_arc;
    auto pairs = edgePairs(graphs->grid2mesh);

    for (int g = 0; g < graphs->numGridNodes(); ++g) {
        for (int m = 0; m < graphs->numMeshNodes(); ++m) {
            double d = Sphere::greatCircleDistance(graphs->grid.positions[g],
                                                   graphs->mesh.positions()[m]);
            if (d < radius - 1e-9) {
                EXPECT_TRUE(pairs.count({g, m})) << "grid " << g << " mesh " << m;
            }
        }
    }
}

TEST_F(ForecastGraphsTest, Mesh2GridUsesEnclosingTriangle) {
    auto graphs = GraphBuilder::build(config);
    const EdgeSet& m2g = graphs->mesh2grid;
    EXPECT_EQ(m2g.numEdges(), 3 * graphs->numGridNodes());

    for (int g = 0; g < graphs->numGridNodes(); ++g) {
        ASSERT_EQ(m2g.inDegree(g), 3);
        double total = 0.0;
        for (int k = m2g.recv_offsets[g]; k < m2g.recv_offsets[g + 1]; ++k) {
            int e = m2g.recv_edges[k];
            EXPECT_GE(m2g.weights[e], 0.0);
            total += m2g.weights[e];
        }
        EXPECT_NEAR(total, config.mesh2grid_edge_normalization_factor, 1e-12);
    }
}

TEST_F(ForecastGraphsTest, BuildIsDeterministic) {
    auto a = GraphBuilder::build(config);
    auto b = GraphBuilder::build(config);
    EXPECT_EQ(a->grid2mesh.senders, b->grid2mesh.senders);
    EXPECT_EQ(a->grid2mesh.receivers, b->grid2mesh.receivers);
    EXPECT_EQ(a->mesh2grid.senders, b->mesh2grid.senders);
    EXPECT_DOUBLE_EQ(a->mesh2grid.features.maxAbsDiff(b->mesh2grid.features), 0.0);
}

TEST_F(ForecastGraphsTest, InvalidBuildParameters) {
    GraphBuildConfig bad = config;
    bad.radius_query_fraction_edge_length = 0.0;
    EXPECT_THROW(GraphBuilder::build(bad), ConfigurationError);

    bad = config;
    bad.mesh2grid_edge_normalization_factor = -1.0;
    EXPECT_THROW(GraphBuilder::build(bad), ConfigurationError);

    // A radius far below the mesh spacing leaves grid nodes unconnected
    bad = config;
    bad.radius_query_fraction_edge_length = 1e-4;
    EXPECT_THROW(GraphBuilder::build(bad), ConfigurationError);
}

TEST_F(ForecastGraphsTest, ValidateRejectsBrokenGraphs) {
    auto graphs = GraphBuilder::build(config);
    EXPECT_NO_THROW(graphs->validate());

    ForecastGraphs broken = *graphs;
    broken.grid2mesh.receivers[0] = broken.mesh.numNodes() + 5;
    EXPECT_THROW(broken.validate(), ConfigurationError);

    broken = *graphs;
    broken.mesh2grid.num_receivers = broken.grid.numNodes() + 1;
    EXPECT_THROW(broken.validate(), ConfigurationError);
}
