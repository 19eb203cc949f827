/**
 * @file ForecastConfig.cpp
 * @brief Validation of the forecast configuration
 */

#include "ForecastConfig.hpp"
#include <sstream>

namespace MMWF {

std::vector<std::string> ForecastConfig::validate() const {
    std::vector<std::string> errors;
    auto positive = [&errors](int value, const char* name) {
        if (value <= 0) {
            errors.push_back(std::string(name) + " must be positive (got " +
                             std::to_string(value) + ")");
        }
    };

    // Graph geometry
    if (graph.mesh_size < 0) {
        errors.push_back("GRAPH.mesh_size must be >= 0");
    } else if (graph.mesh_size > 12) {
        errors.push_back("GRAPH.mesh_size is too large (" + std::to_string(graph.mesh_size) + ")");
    } else if (model.mesh_node_num != IcosahedralMesh::vertexCount(graph.mesh_size)) {
        errors.push_back("MODEL.mesh_node_num must be 10*4^mesh_size + 2 = " +
                         std::to_string(IcosahedralMesh::vertexCount(graph.mesh_size)) +
                         " (got " + std::to_string(model.mesh_node_num) + ")");
    }
    if (!(graph.radius_query_fraction_edge_length > 0.0)) {
        errors.push_back("GRAPH.radius_query_fraction_edge_length must be > 0");
    }
    if (!(graph.mesh2grid_edge_normalization_factor > 0.0)) {
        errors.push_back("GRAPH.mesh2grid_edge_normalization_factor must be > 0");
    }

    const bool explicit_grid = !graph.grid_latitudes.empty() || !graph.grid_longitudes.empty();
    long long grid_count = LatLonGrid::regularCount(graph.resolution);
    if (explicit_grid) {
        if (graph.grid_latitudes.size() != graph.grid_longitudes.size()) {
            errors.push_back("GRAPH.grid_latitudes and GRAPH.grid_longitudes differ in length");
        } else if (model.grid_node_num != static_cast<int>(graph.grid_latitudes.size())) {
            errors.push_back("MODEL.grid_node_num must equal the number of grid points (" +
                             std::to_string(graph.grid_latitudes.size()) + ")");
        }
    } else if (grid_count == 0) {
        std::ostringstream ss;
        ss << "GRAPH.resolution " << graph.resolution << " must divide 180 and 360";
        errors.push_back(ss.str());
    } else if (model.grid_node_num != grid_count) {
        errors.push_back("MODEL.grid_node_num must be " + std::to_string(grid_count) +
                         " for the configured resolution (got " +
                         std::to_string(model.grid_node_num) + ")");
    }

    // Model dimensions
    positive(model.grid_node_dim, "MODEL.grid_node_dim");
    positive(model.grid_node_emb_dim, "MODEL.grid_node_emb_dim");
    positive(model.mesh_node_dim, "MODEL.mesh_node_dim");
    positive(model.mesh_node_emb_dim, "MODEL.mesh_node_emb_dim");
    positive(model.mesh_edge_emb_dim, "MODEL.mesh_edge_emb_dim");
    positive(model.grid2mesh_edge_emb_dim, "MODEL.grid2mesh_edge_emb_dim");
    positive(model.mesh2grid_edge_emb_dim, "MODEL.mesh2grid_edge_emb_dim");
    positive(model.gnn_msg_steps, "MODEL.gnn_msg_steps");
    positive(model.node_output_dim, "MODEL.node_output_dim");
    positive(model.history_length, "MODEL.history_length");

    if (model.mesh_edge_dim != EDGE_FEATURE_DIM) {
        errors.push_back("MODEL.mesh_edge_dim must be " + std::to_string(EDGE_FEATURE_DIM));
    }
    if (model.grid2mesh_edge_dim != EDGE_FEATURE_DIM) {
        errors.push_back("MODEL.grid2mesh_edge_dim must be " + std::to_string(EDGE_FEATURE_DIM));
    }
    if (model.mesh2grid_edge_dim != EDGE_FEATURE_DIM) {
        errors.push_back("MODEL.mesh2grid_edge_dim must be " + std::to_string(EDGE_FEATURE_DIM));
    }
    if (model.forcing_dim < 0) {
        errors.push_back("MODEL.forcing_dim must be >= 0");
    } else if (model.grid_node_dim !=
               model.history_length * model.node_output_dim + model.forcing_dim) {
        errors.push_back("MODEL.grid_node_dim (" + std::to_string(model.grid_node_dim) +
                         ") must equal history_length * node_output_dim + forcing_dim (" +
                         std::to_string(model.history_length * model.node_output_dim +
                                        model.forcing_dim) + ")");
    }

    // Data
    if (data.mean_path.empty()) errors.push_back("DATA.mean_path is required");
    if (data.stddev_path.empty()) errors.push_back("DATA.stddev_path is required");
    if (data.stddev_diffs_path.empty()) errors.push_back("DATA.stddev_diffs_path is required");
    if (data.forcing_mean_path.empty() != data.forcing_stddev_path.empty()) {
        errors.push_back("DATA.forcing_mean_path and DATA.forcing_stddev_path go together");
    }
    if (!(data.stddev_epsilon > 0.0)) {
        errors.push_back("NORMALIZATION.stddev_epsilon must be > 0");
    }

    // Evaluation
    positive(eval.batch_size, "EVAL.batch_size");
    positive(eval.forecast_steps, "EVAL.forecast_steps");

    return errors;
}

} // namespace MMWF
