/**
 * @file NeuralLayers.cpp
 * @brief Implementation of Linear, LayerNorm and MLPModel
 */

#include "NeuralLayers.hpp"
#include "Initializer.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace MMWF {
namespace ML {

// =============================================================================
// Linear Layer Implementation
// =============================================================================

Linear::Linear(int in_features, int out_features, bool bias)
    : has_bias(bias) {
    if (in_features <= 0 || out_features <= 0) {
        throw std::invalid_argument("Linear: feature sizes must be positive");
    }

    weight = Tensor({out_features, in_features});
    if (has_bias) {
        bias_vec = Tensor({out_features}, 0.0);
    }
}

Tensor Linear::forward(const Tensor& x) const {
    const int in_f = weight.shape[1];
    const int out_f = weight.shape[0];

    if (x.dim() == 0 || x.shape.back() != in_f) {
        throw std::invalid_argument("Linear::forward: expected last axis " +
                                    std::to_string(in_f) + ", got " + x.shapeString());
    }

    // Flatten leading dimensions
    const int batch_size = static_cast<int>(x.numel() / in_f);

    std::vector<int> out_shape = x.shape;
    out_shape.back() = out_f;
    Tensor output(out_shape);

    #pragma omp parallel for
    for (int b = 0; b < batch_size; ++b) {
        const double* in = x.data.data() + static_cast<size_t>(b) * in_f;
        double* out = output.data.data() + static_cast<size_t>(b) * out_f;
        for (int o = 0; o < out_f; ++o) {
            const double* w = weight.data.data() + static_cast<size_t>(o) * in_f;
            double sum = has_bias ? bias_vec.data[o] : 0.0;
            for (int i = 0; i < in_f; ++i) {
                sum += w[i] * in[i];
            }
            out[o] = sum;
        }
    }

    return output;
}

void Linear::initWeights(const std::string& method, std::mt19937& rng) {
    Tensor* bias = has_bias ? &bias_vec : nullptr;

    if (method == "linear") {
        Init::linearInit(weight, bias, rng);
        return;
    }

    if (method == "xavier") {
        Init::xavierUniform(weight, rng);
    } else if (method == "kaiming") {
        Init::kaimingUniform(weight, rng, 0.0, Init::FanMode::FAN_IN, "relu");
    } else if (method == "trunc_normal") {
        Init::truncNormal(weight, 0.0, 0.02, -2.0, 2.0, rng);
    } else {
        throw std::invalid_argument("Unknown weight init: " + method);
    }
    if (bias) Init::zeros(*bias);
}

// =============================================================================
// LayerNorm Implementation
// =============================================================================

LayerNorm::LayerNorm(int normalized_shape, double eps)
    : normalized_shape(normalized_shape), eps(eps) {
    gamma = Tensor({normalized_shape}, 1.0);
    beta = Tensor({normalized_shape}, 0.0);
}

Tensor LayerNorm::forward(const Tensor& x) const {
    if (x.dim() == 0 || x.shape.back() != normalized_shape) {
        throw std::invalid_argument("LayerNorm::forward: expected last axis " +
                                    std::to_string(normalized_shape) + ", got " +
                                    x.shapeString());
    }

    // Normalize along last dimension
    const int batch_size = static_cast<int>(x.numel() / normalized_shape);
    Tensor output(x.shape);

    #pragma omp parallel for
    for (int b = 0; b < batch_size; ++b) {
        const double* in = x.data.data() + static_cast<size_t>(b) * normalized_shape;
        double* out = output.data.data() + static_cast<size_t>(b) * normalized_shape;

        double mean = 0.0;
        for (int i = 0; i < normalized_shape; ++i) mean += in[i];
        mean /= normalized_shape;

        double var = 0.0;
        for (int i = 0; i < normalized_shape; ++i) {
            double diff = in[i] - mean;
            var += diff * diff;
        }
        var /= normalized_shape;

        double std_inv = 1.0 / std::sqrt(var + eps);
        for (int i = 0; i < normalized_shape; ++i) {
            out[i] = gamma.data[i] * (in[i] - mean) * std_inv + beta.data[i];
        }
    }

    return output;
}

// =============================================================================
// MLP Model Implementation
// =============================================================================

MLPModel::MLPModel(const MLPConfig& config, std::mt19937& rng) : config_(config) {
    if (config_.layer_sizes.size() < 2) {
        throw std::invalid_argument("MLP needs at least input and output layers");
    }

    for (size_t i = 0; i + 1 < config_.layer_sizes.size(); ++i) {
        auto layer = std::make_unique<Linear>(config_.layer_sizes[i],
                                              config_.layer_sizes[i + 1], true);
        layer->initWeights(config_.weight_init, rng);
        dense_layers_.push_back(std::move(layer));
    }

    if (config_.use_layer_norm) {
        layer_norm_ = std::make_unique<LayerNorm>(config_.layer_sizes.back());
    }

    activation_fn_ = Activation::getActivation(config_.activation);
}

Tensor MLPModel::forward(const Tensor& x) const {
    Tensor h = dense_layers_[0]->forward(x);

    for (size_t i = 1; i < dense_layers_.size(); ++i) {
        h = activation_fn_(h);
        h = dense_layers_[i]->forward(h);
    }

    if (layer_norm_) {
        h = layer_norm_->forward(h);
    }
    return h;
}

NamedParameters MLPModel::namedParameters(const std::string& prefix) {
    NamedParameters params;
    for (size_t i = 0; i < dense_layers_.size(); ++i) {
        const std::string base = prefix + ".dense" + std::to_string(i);
        params.emplace_back(base + ".weight", &dense_layers_[i]->weight);
        if (dense_layers_[i]->has_bias) {
            params.emplace_back(base + ".bias", &dense_layers_[i]->bias_vec);
        }
    }
    if (layer_norm_) {
        params.emplace_back(prefix + ".norm.gamma", &layer_norm_->gamma);
        params.emplace_back(prefix + ".norm.beta", &layer_norm_->beta);
    }
    return params;
}

ConstNamedParameters MLPModel::namedParameters(const std::string& prefix) const {
    ConstNamedParameters params;
    for (auto& p : const_cast<MLPModel*>(this)->namedParameters(prefix)) {
        params.emplace_back(p.first, p.second);
    }
    return params;
}

size_t MLPModel::numParameters() const {
    size_t count = 0;
    for (const auto& layer : dense_layers_) {
        count += layer->weight.numel();
        if (layer->has_bias) count += layer->bias_vec.numel();
    }
    if (layer_norm_) {
        count += layer_norm_->gamma.numel() + layer_norm_->beta.numel();
    }
    return count;
}

void MLPModel::summary(const std::string& name) const {
    std::cout << "  " << name << ": ";
    for (size_t i = 0; i < config_.layer_sizes.size(); ++i) {
        if (i > 0) std::cout << " -> ";
        std::cout << config_.layer_sizes[i];
    }
    std::cout << " (" << config_.activation
              << (config_.use_layer_norm ? ", layer norm" : "")
              << ", " << numParameters() << " params)\n";
}

} // namespace ML
} // namespace MMWF
