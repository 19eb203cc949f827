/**
 * @file GraphNetwork.cpp
 * @brief Interaction network, encoder, processor and decoder
 */

#include "GraphNetwork.hpp"
#include <iostream>
#include <stdexcept>

namespace MMWF {

namespace {

// Linear(in -> out) -> activation -> Linear(out -> out) [-> LayerNorm]
std::unique_ptr<ML::MLPModel> makeBlock(int in_dim, int out_dim, const ModelConfig& config,
                                        bool layer_norm, std::mt19937& rng) {
    ML::MLPConfig mlp;
    mlp.layer_sizes = {in_dim, out_dim, out_dim};
    mlp.activation = config.activation;
    mlp.use_layer_norm = layer_norm && config.use_layer_norm;
    mlp.weight_init = config.weight_init;
    return std::make_unique<ML::MLPModel>(mlp, rng);
}

void requireRows(const ML::Tensor& t, int rows, int cols, const char* what) {
    if (t.dim() != 2 || t.rows() != rows || t.cols() != cols) {
        throw std::invalid_argument(std::string(what) + ": expected [" +
                                    std::to_string(rows) + ", " + std::to_string(cols) +
                                    "], got " + t.shapeString());
    }
}

void append(ML::NamedParameters& into, ML::NamedParameters&& from) {
    into.insert(into.end(), from.begin(), from.end());
}

} // namespace

// =============================================================================
// InteractionNetwork Implementation
// =============================================================================

InteractionNetwork::InteractionNetwork(int sender_dim, int receiver_dim, int edge_dim,
                                       const ModelConfig& config, std::mt19937& rng)
    : sender_dim_(sender_dim), receiver_dim_(receiver_dim), edge_dim_(edge_dim) {

    // Edge MLP: [edge, sender, receiver] -> edge
    edge_mlp_ = makeBlock(edge_dim + sender_dim + receiver_dim, edge_dim, config, true, rng);

    // Node MLP: [receiver, aggregated] -> receiver
    node_mlp_ = makeBlock(receiver_dim + edge_dim, receiver_dim, config, true, rng);
}

InteractionNetwork::Result InteractionNetwork::forward(const EdgeSet& graph,
                                                       const ML::Tensor& senders,
                                                       const ML::Tensor& receivers,
                                                       const ML::Tensor& edges) const {
    Result result;
    result.edges = updateEdges(graph, senders, receivers, edges);
    result.receivers = updateNodes(receivers, aggregate(graph, result.edges));
    return result;
}

ML::Tensor InteractionNetwork::updateEdges(const EdgeSet& graph, const ML::Tensor& senders,
                                           const ML::Tensor& receivers,
                                           const ML::Tensor& edges) const {
    requireRows(senders, graph.num_senders, sender_dim_, "InteractionNetwork senders");
    requireRows(receivers, graph.num_receivers, receiver_dim_, "InteractionNetwork receivers");
    requireRows(edges, graph.numEdges(), edge_dim_, "InteractionNetwork edges");

    ML::Tensor s = ML::gatherRows(senders, graph.senders);
    ML::Tensor r = ML::gatherRows(receivers, graph.receivers);
    ML::Tensor input = ML::concatColumns({&edges, &s, &r});

    ML::Tensor updated = edge_mlp_->forward(input);
    updated += edges;
    return updated;
}

ML::Tensor InteractionNetwork::aggregate(const EdgeSet& graph, const ML::Tensor& edges) {
    const int n = graph.num_receivers;
    const int dim = edges.cols();
    ML::Tensor aggregated({n, dim}, 0.0);

    #pragma omp parallel for
    for (int r = 0; r < n; ++r) {
        double* out = aggregated.row(r);
        for (int k = graph.recv_offsets[r]; k < graph.recv_offsets[r + 1]; ++k) {
            const int e = graph.recv_edges[k];
            const double w = graph.weights[e];
            const double* in = edges.row(e);
            for (int d = 0; d < dim; ++d) {
                out[d] += w * in[d];
            }
        }
    }
    return aggregated;
}

ML::Tensor InteractionNetwork::updateNodes(const ML::Tensor& receivers,
                                           const ML::Tensor& aggregated) const {
    ML::Tensor input = ML::concatColumns({&receivers, &aggregated});
    ML::Tensor updated = node_mlp_->forward(input);
    updated += receivers;
    return updated;
}

ML::NamedParameters InteractionNetwork::namedParameters(const std::string& prefix) {
    ML::NamedParameters params = edge_mlp_->namedParameters(prefix + ".edge_mlp");
    append(params, node_mlp_->namedParameters(prefix + ".node_mlp"));
    return params;
}

size_t InteractionNetwork::numParameters() const {
    return edge_mlp_->numParameters() + node_mlp_->numParameters();
}

// =============================================================================
// Encoder Implementation
// =============================================================================

Encoder::Encoder(const ModelConfig& config, std::mt19937& rng) {
    grid_embed_ = makeBlock(config.grid_node_dim, config.grid_node_emb_dim, config, true, rng);
    mesh_embed_ = makeBlock(config.mesh_node_dim, config.mesh_node_emb_dim, config, true, rng);
    mesh_edge_embed_ = makeBlock(config.mesh_edge_dim, config.mesh_edge_emb_dim,
                                 config, true, rng);
    g2m_edge_embed_ = makeBlock(config.grid2mesh_edge_dim, config.grid2mesh_edge_emb_dim,
                                config, true, rng);

    g2m_ = std::make_unique<InteractionNetwork>(config.grid_node_emb_dim,
                                                config.mesh_node_emb_dim,
                                                config.grid2mesh_edge_emb_dim, config, rng);

    grid_update_ = makeBlock(config.grid_node_emb_dim, config.grid_node_emb_dim,
                             config, true, rng);
}

Encoder::Output Encoder::forward(const ForecastGraphs& graphs,
                                 const ML::Tensor& grid_features,
                                 const ML::Tensor& mesh_features) const {
    ML::Tensor grid = grid_embed_->forward(grid_features);
    ML::Tensor mesh = mesh_embed_->forward(mesh_features);
    ML::Tensor g2m_edges = g2m_edge_embed_->forward(graphs.grid2mesh.features);

    Output out;
    out.mesh_edges = mesh_edge_embed_->forward(graphs.mesh.edges.features);

    // Grid -> mesh round; only the mesh side is kept
    out.mesh_nodes = g2m_->forward(graphs.grid2mesh, grid, mesh, g2m_edges).receivers;

    // Grid latent carried to the decoder
    out.grid_latent = grid_update_->forward(grid);
    out.grid_latent += grid;

    return out;
}

ML::NamedParameters Encoder::namedParameters(const std::string& prefix) {
    ML::NamedParameters params = grid_embed_->namedParameters(prefix + ".grid_embed");
    append(params, mesh_embed_->namedParameters(prefix + ".mesh_embed"));
    append(params, mesh_edge_embed_->namedParameters(prefix + ".mesh_edge_embed"));
    append(params, g2m_edge_embed_->namedParameters(prefix + ".g2m_edge_embed"));
    append(params, g2m_->namedParameters(prefix + ".g2m"));
    append(params, grid_update_->namedParameters(prefix + ".grid_update"));
    return params;
}

size_t Encoder::numParameters() const {
    return grid_embed_->numParameters() + mesh_embed_->numParameters() +
           mesh_edge_embed_->numParameters() + g2m_edge_embed_->numParameters() +
           g2m_->numParameters() + grid_update_->numParameters();
}

void Encoder::summary() const {
    std::cout << "Encoder\n";
    grid_embed_->summary("grid_embed");
    mesh_embed_->summary("mesh_embed");
    mesh_edge_embed_->summary("mesh_edge_embed");
    g2m_edge_embed_->summary("g2m_edge_embed");
    g2m_->edgeMLP().summary("g2m.edge_mlp");
    g2m_->nodeMLP().summary("g2m.node_mlp");
    grid_update_->summary("grid_update");
}

// =============================================================================
// Processor Implementation
// =============================================================================

Processor::Processor(const ModelConfig& config, std::mt19937& rng) {
    for (int i = 0; i < config.gnn_msg_steps; ++i) {
        rounds_.push_back(std::make_unique<InteractionNetwork>(
            config.mesh_node_emb_dim, config.mesh_node_emb_dim,
            config.mesh_edge_emb_dim, config, rng));
    }
}

void Processor::forward(const EdgeSet& mesh_edges, ML::Tensor& nodes,
                        ML::Tensor& edges) const {
    for (const auto& round : rounds_) {
        // Both updates read the pre-round snapshot; commit afterwards
        InteractionNetwork::Result next = round->forward(mesh_edges, nodes, nodes, edges);
        nodes = std::move(next.receivers);
        edges = std::move(next.edges);
    }
}

ML::NamedParameters Processor::namedParameters(const std::string& prefix) {
    ML::NamedParameters params;
    for (size_t i = 0; i < rounds_.size(); ++i) {
        append(params, rounds_[i]->namedParameters(prefix + ".round" + std::to_string(i)));
    }
    return params;
}

size_t Processor::numParameters() const {
    size_t count = 0;
    for (const auto& round : rounds_) count += round->numParameters();
    return count;
}

// =============================================================================
// Decoder Implementation
// =============================================================================

Decoder::Decoder(const ModelConfig& config, std::mt19937& rng) {
    m2g_edge_embed_ = makeBlock(config.mesh2grid_edge_dim, config.mesh2grid_edge_emb_dim,
                                config, true, rng);

    m2g_ = std::make_unique<InteractionNetwork>(config.mesh_node_emb_dim,
                                                config.grid_node_emb_dim,
                                                config.mesh2grid_edge_emb_dim, config, rng);

    // Regression head, no output normalisation
    head_ = makeBlock(config.grid_node_emb_dim, config.node_output_dim, config, false, rng);
}

ML::Tensor Decoder::forward(const ForecastGraphs& graphs, const ML::Tensor& mesh_nodes,
                            const ML::Tensor& grid_latent) const {
    ML::Tensor m2g_edges = m2g_edge_embed_->forward(graphs.mesh2grid.features);
    ML::Tensor grid = m2g_->forward(graphs.mesh2grid, mesh_nodes, grid_latent,
                                    m2g_edges).receivers;
    return head_->forward(grid);
}

ML::NamedParameters Decoder::namedParameters(const std::string& prefix) {
    ML::NamedParameters params = m2g_edge_embed_->namedParameters(prefix + ".m2g_edge_embed");
    append(params, m2g_->namedParameters(prefix + ".m2g"));
    append(params, head_->namedParameters(prefix + ".head"));
    return params;
}

size_t Decoder::numParameters() const {
    return m2g_edge_embed_->numParameters() + m2g_->numParameters() + head_->numParameters();
}

void Decoder::summary() const {
    std::cout << "Decoder\n";
    m2g_edge_embed_->summary("m2g_edge_embed");
    m2g_->edgeMLP().summary("m2g.edge_mlp");
    m2g_->nodeMLP().summary("m2g.node_mlp");
    head_->summary("head");
}

} // namespace MMWF
