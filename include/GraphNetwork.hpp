/**
 * @file GraphNetwork.hpp
 * @brief Encode-process-decode message passing on the forecast graphs
 *
 * Every stage is built from interaction networks:
 *
 *   e'_k = e_k + phi_e([e_k, v_s(k), v_r(k)])
 *   a_i  = sum_{k : r(k) = i} w_k e'_k
 *   v'_i = v_i + phi_v([v_i, a_i])
 *
 * where phi are MLP blocks (Linear -> activation -> Linear -> LayerNorm) and
 * w_k is the edge weight stored with the graph (1 except for Mesh2Grid).
 *
 * Pipeline:
 * - Encoder: embed grid / mesh nodes and edges, one Grid2Mesh round
 * - Processor: gnn_msg_steps rounds over the mesh, each with its own weights
 * - Decoder: one Mesh2Grid round, then a regression head
 *
 * Graphs are never modified; every call returns freshly allocated latents.
 */

#ifndef MMWF_GRAPH_NETWORK_HPP
#define MMWF_GRAPH_NETWORK_HPP

#include "ForecastGraphs.hpp"
#include "NeuralLayers.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace MMWF {

// =============================================================================
// Model configuration
// =============================================================================

/**
 * @brief Dimensions and architecture of the forecast network
 *
 * Defaults correspond to the 1-degree, level-5 configuration.
 */
struct ModelConfig {
    int grid_node_dim = 186;        // history_length * node_output_dim + forcing_dim
    int grid_node_num = 65160;
    int grid_node_emb_dim = 512;
    int mesh_node_dim = 186;
    int mesh_node_num = 10242;
    int mesh_node_emb_dim = 512;
    int mesh_edge_dim = 4;
    int mesh_edge_emb_dim = 512;
    int grid2mesh_edge_dim = 4;
    int grid2mesh_edge_emb_dim = 512;
    int mesh2grid_edge_dim = 4;
    int mesh2grid_edge_emb_dim = 512;
    int gnn_msg_steps = 16;
    int node_output_dim = 83;

    int history_length = 2;         // Past states stacked into the input
    int forcing_dim = 20;           // Trailing forcing columns of the input

    std::string activation = "silu";
    bool use_layer_norm = true;
    std::string weight_init = "linear";
};

// =============================================================================
// Interaction network
// =============================================================================

/**
 * @brief One message-passing round over a (possibly bipartite) edge set
 */
class InteractionNetwork {
public:
    InteractionNetwork(int sender_dim, int receiver_dim, int edge_dim,
                       const ModelConfig& config, std::mt19937& rng);

    struct Result {
        ML::Tensor edges;       // [E, edge_dim]
        ML::Tensor receivers;   // [R, receiver_dim]
    };

    /**
     * @brief Synchronous round: edges from the inputs, then receivers from the
     *        inputs and the new edges. Inputs are not modified.
     */
    Result forward(const EdgeSet& graph, const ML::Tensor& senders,
                   const ML::Tensor& receivers, const ML::Tensor& edges) const;

    ML::Tensor updateEdges(const EdgeSet& graph, const ML::Tensor& senders,
                           const ML::Tensor& receivers, const ML::Tensor& edges) const;

    /// Weighted per-receiver sum, walked in edge-id order
    static ML::Tensor aggregate(const EdgeSet& graph, const ML::Tensor& edges);

    ML::Tensor updateNodes(const ML::Tensor& receivers, const ML::Tensor& aggregated) const;

    ML::MLPModel& edgeMLP() { return *edge_mlp_; }
    ML::MLPModel& nodeMLP() { return *node_mlp_; }
    const ML::MLPModel& edgeMLP() const { return *edge_mlp_; }
    const ML::MLPModel& nodeMLP() const { return *node_mlp_; }

    ML::NamedParameters namedParameters(const std::string& prefix);
    size_t numParameters() const;

private:
    int sender_dim_, receiver_dim_, edge_dim_;
    std::unique_ptr<ML::MLPModel> edge_mlp_;
    std::unique_ptr<ML::MLPModel> node_mlp_;
};

// =============================================================================
// Encoder
// =============================================================================

class Encoder {
public:
    Encoder(const ModelConfig& config, std::mt19937& rng);

    struct Output {
        ML::Tensor grid_latent;     // [N, grid_node_emb_dim]
        ML::Tensor mesh_nodes;      // [M, mesh_node_emb_dim]
        ML::Tensor mesh_edges;      // [E_mesh, mesh_edge_emb_dim]
    };

    /**
     * @param grid_features  [N, grid_node_dim] normalised grid input
     * @param mesh_features  [M, mesh_node_dim] mesh placeholder input
     */
    Output forward(const ForecastGraphs& graphs, const ML::Tensor& grid_features,
                   const ML::Tensor& mesh_features) const;

    ML::NamedParameters namedParameters(const std::string& prefix);
    size_t numParameters() const;
    void summary() const;

private:
    std::unique_ptr<ML::MLPModel> grid_embed_;
    std::unique_ptr<ML::MLPModel> mesh_embed_;
    std::unique_ptr<ML::MLPModel> mesh_edge_embed_;
    std::unique_ptr<ML::MLPModel> g2m_edge_embed_;
    std::unique_ptr<InteractionNetwork> g2m_;
    std::unique_ptr<ML::MLPModel> grid_update_;
};

// =============================================================================
// Processor
// =============================================================================

class Processor {
public:
    Processor(const ModelConfig& config, std::mt19937& rng);

    /**
     * @brief Run all rounds; each round reads only the previous round's state
     */
    void forward(const EdgeSet& mesh_edges, ML::Tensor& nodes, ML::Tensor& edges) const;

    int numRounds() const { return static_cast<int>(rounds_.size()); }
    InteractionNetwork& round(int i) { return *rounds_.at(i); }
    const InteractionNetwork& round(int i) const { return *rounds_.at(i); }

    ML::NamedParameters namedParameters(const std::string& prefix);
    size_t numParameters() const;

private:
    std::vector<std::unique_ptr<InteractionNetwork>> rounds_;
};

// =============================================================================
// Decoder
// =============================================================================

class Decoder {
public:
    Decoder(const ModelConfig& config, std::mt19937& rng);

    /**
     * @return [N, node_output_dim] normalised increment
     */
    ML::Tensor forward(const ForecastGraphs& graphs, const ML::Tensor& mesh_nodes,
                       const ML::Tensor& grid_latent) const;

    ML::NamedParameters namedParameters(const std::string& prefix);
    size_t numParameters() const;
    void summary() const;

private:
    std::unique_ptr<ML::MLPModel> m2g_edge_embed_;
    std::unique_ptr<InteractionNetwork> m2g_;
    std::unique_ptr<ML::MLPModel> head_;
};

} // namespace MMWF

#endif // MMWF_GRAPH_NETWORK_HPP
