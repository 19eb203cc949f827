/**
 * @file ForecastModel.cpp
 * @brief Forecast network assembly, forward passes and checkpoints
 */

#include "ForecastModel.hpp"
#include "ForecastErrors.hpp"
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <random>

namespace MMWF {

namespace {

const char CHECKPOINT_MAGIC[8] = {'M', 'M', 'W', 'F', 'C', 'K', 'P', '\0'};

void requirePositive(std::vector<std::string>& errors, int value, const char* name) {
    if (value <= 0) {
        errors.push_back(std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

} // namespace

// =============================================================================
// ForecastModel Implementation
// =============================================================================

std::vector<std::string> ForecastModel::checkDimensions(const ModelConfig& config,
                                                        const ForecastGraphs& graphs) {
    std::vector<std::string> errors;

    requirePositive(errors, config.grid_node_dim, "grid_node_dim");
    requirePositive(errors, config.grid_node_emb_dim, "grid_node_emb_dim");
    requirePositive(errors, config.mesh_node_dim, "mesh_node_dim");
    requirePositive(errors, config.mesh_node_emb_dim, "mesh_node_emb_dim");
    requirePositive(errors, config.mesh_edge_emb_dim, "mesh_edge_emb_dim");
    requirePositive(errors, config.grid2mesh_edge_emb_dim, "grid2mesh_edge_emb_dim");
    requirePositive(errors, config.mesh2grid_edge_emb_dim, "mesh2grid_edge_emb_dim");
    requirePositive(errors, config.gnn_msg_steps, "gnn_msg_steps");
    requirePositive(errors, config.node_output_dim, "node_output_dim");

    if (config.mesh_edge_dim != EDGE_FEATURE_DIM ||
        config.grid2mesh_edge_dim != EDGE_FEATURE_DIM ||
        config.mesh2grid_edge_dim != EDGE_FEATURE_DIM) {
        errors.push_back("edge feature dimensions must all be " +
                         std::to_string(EDGE_FEATURE_DIM));
    }
    if (config.grid_node_num != graphs.numGridNodes()) {
        errors.push_back("grid_node_num is " + std::to_string(config.grid_node_num) +
                         " but the grid has " + std::to_string(graphs.numGridNodes()) +
                         " nodes");
    }
    if (config.mesh_node_num != graphs.numMeshNodes()) {
        errors.push_back("mesh_node_num is " + std::to_string(config.mesh_node_num) +
                         " but the mesh has " + std::to_string(graphs.numMeshNodes()) +
                         " nodes");
    }
    return errors;
}

ForecastModel::ForecastModel(const ModelConfig& config,
                             std::shared_ptr<const ForecastGraphs> graphs,
                             unsigned int seed)
    : config_(config), graphs_(std::move(graphs)) {
    if (!graphs_) {
        throw ConfigurationError("forecast model needs graphs");
    }

    auto errors = checkDimensions(config_, *graphs_);
    if (!errors.empty()) {
        std::string msg = "model does not match graphs:";
        for (const auto& e : errors) msg += "\n  " + e;
        throw ConfigurationError(msg);
    }

    std::mt19937 rng(seed);
    encoder_ = std::make_unique<Encoder>(config_, rng);
    processor_ = std::make_unique<Processor>(config_, rng);
    decoder_ = std::make_unique<Decoder>(config_, rng);

    mesh_features_ = graphs_->mesh.placeholderFeatures(config_.mesh_node_dim);
}

ML::Tensor ForecastModel::forward(const ML::Tensor& normalized) const {
    if (normalized.dim() != 2 || normalized.rows() != config_.grid_node_num ||
        normalized.cols() != config_.grid_node_dim) {
        throw DataError("model input must be [" + std::to_string(config_.grid_node_num) +
                        ", " + std::to_string(config_.grid_node_dim) + "], got " +
                        normalized.shapeString());
    }
    if (!normalized.allFinite()) {
        throw NumericError("model input contains non-finite values");
    }

    Encoder::Output latent = encoder_->forward(*graphs_, normalized, mesh_features_);
    processor_->forward(graphs_->mesh.edges, latent.mesh_nodes, latent.mesh_edges);
    ML::Tensor increment = decoder_->forward(*graphs_, latent.mesh_nodes, latent.grid_latent);

    if (!increment.allFinite()) {
        throw NumericError("model output contains non-finite values");
    }
    return increment;
}

ML::Tensor ForecastModel::forwardBatch(const ML::Tensor& batch) const {
    if (batch.dim() != 3) {
        throw DataError("batched model input must be [B, N, D], got " + batch.shapeString());
    }
    if (batch.shape[0] == 0) {
        throw DataError("batched model input holds no elements");
    }

    std::vector<ML::Tensor> outputs;
    outputs.reserve(batch.shape[0]);
    for (int b = 0; b < batch.shape[0]; ++b) {
        outputs.push_back(forward(batch.slice(b)));
    }
    return ML::stack(outputs);
}

ML::NamedParameters ForecastModel::namedParameters() {
    ML::NamedParameters params = encoder_->namedParameters("encoder");
    ML::NamedParameters proc = processor_->namedParameters("processor");
    ML::NamedParameters dec = decoder_->namedParameters("decoder");
    params.insert(params.end(), proc.begin(), proc.end());
    params.insert(params.end(), dec.begin(), dec.end());
    return params;
}

ML::ConstNamedParameters ForecastModel::namedParameters() const {
    ML::ConstNamedParameters params;
    for (auto& p : const_cast<ForecastModel*>(this)->namedParameters()) {
        params.emplace_back(p.first, p.second);
    }
    return params;
}

size_t ForecastModel::numParameters() const {
    return encoder_->numParameters() + processor_->numParameters() +
           decoder_->numParameters();
}

void ForecastModel::summary() const {
    std::cout << "Multi-mesh Forecast Model Summary\n";
    std::cout << "=================================\n";
    std::cout << "Grid nodes: " << config_.grid_node_num
              << "  input dim: " << config_.grid_node_dim
              << "  output dim: " << config_.node_output_dim << "\n";
    std::cout << "Mesh nodes: " << config_.mesh_node_num
              << "  mesh edges: " << graphs_->mesh.edges.numEdges() << "\n";
    std::cout << "Message passing steps: " << config_.gnn_msg_steps << "\n";
    encoder_->summary();
    std::cout << "Processor\n";
    std::cout << "  " << processor_->numRounds() << " rounds, "
              << processor_->numParameters() << " params\n";
    decoder_->summary();
    std::cout << "Parameters: " << numParameters() << "\n";
}

// =============================================================================
// ModelCheckpoint Implementation
// =============================================================================

void ModelCheckpoint::save(const ForecastModel& model, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DataError("cannot write checkpoint: " + path);
    }

    const ML::ConstNamedParameters params = model.namedParameters();

    file.write(CHECKPOINT_MAGIC, sizeof(CHECKPOINT_MAGIC));
    std::uint32_t version = VERSION;
    std::uint32_t count = static_cast<std::uint32_t>(params.size());
    file.write(reinterpret_cast<const char*>(&version), sizeof(version));
    file.write(reinterpret_cast<const char*>(&count), sizeof(count));

    for (const auto& p : params) {
        std::uint32_t len = static_cast<std::uint32_t>(p.first.size());
        file.write(reinterpret_cast<const char*>(&len), sizeof(len));
        file.write(p.first.data(), len);
        p.second->write(file);
    }

    if (!file) {
        throw DataError("failed writing checkpoint: " + path);
    }
}

void ModelCheckpoint::load(ForecastModel& model, const std::string& path) {
    if (path.empty()) {
        throw ConfigurationError("evaluation requires a pretrained checkpoint path");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DataError("cannot open checkpoint: " + path);
    }

    char magic[sizeof(CHECKPOINT_MAGIC)];
    file.read(magic, sizeof(magic));
    if (!file || std::memcmp(magic, CHECKPOINT_MAGIC, sizeof(magic)) != 0) {
        throw DataError(path + " is not a model checkpoint");
    }

    std::uint32_t version = 0, count = 0;
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    file.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!file) {
        throw DataError("truncated checkpoint header: " + path);
    }
    if (version != VERSION) {
        throw DataError("unsupported checkpoint version " + std::to_string(version));
    }

    std::map<std::string, ML::Tensor> stored;
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint32_t len = 0;
        file.read(reinterpret_cast<char*>(&len), sizeof(len));
        if (!file || len > 4096) {
            throw DataError("corrupt tensor name in checkpoint: " + path);
        }
        std::string name(len, '\0');
        file.read(&name[0], len);
        if (!file) {
            throw DataError("truncated checkpoint: " + path);
        }

        ML::Tensor t;
        t.read(file);
        if (!stored.emplace(name, std::move(t)).second) {
            throw DataError("duplicate tensor '" + name + "' in checkpoint");
        }
    }

    ML::NamedParameters params = model.namedParameters();
    for (auto& p : params) {
        auto it = stored.find(p.first);
        if (it == stored.end()) {
            throw DataError("checkpoint is missing tensor '" + p.first + "'");
        }
        if (!it->second.sameShape(*p.second)) {
            throw DataError("tensor '" + p.first + "' has shape " + it->second.shapeString() +
                            " in checkpoint, model expects " + p.second->shapeString());
        }
    }
    if (stored.size() != params.size()) {
        for (const auto& s : stored) {
            bool known = false;
            for (const auto& p : params) {
                if (p.first == s.first) { known = true; break; }
            }
            if (!known) {
                throw DataError("checkpoint has unexpected tensor '" + s.first + "'");
            }
        }
    }

    // Only commit once every tensor has been checked
    for (auto& p : params) {
        *p.second = std::move(stored[p.first]);
    }
}

} // namespace MMWF
