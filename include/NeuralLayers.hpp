/**
 * @file NeuralLayers.hpp
 * @brief Dense building blocks of the forecast network
 *
 * Provides:
 * - Linear: affine map over the last axis ([N, in] -> [N, out])
 * - LayerNorm: per-row normalisation with learned scale and shift
 * - MLPModel: Linear -> activation -> ... -> Linear (-> LayerNorm)
 *
 * All forward passes are const: a layer holds only its parameters and
 * every call allocates its own output, so one model may serve several
 * batch elements at once.
 */

#ifndef MMWF_NEURAL_LAYERS_HPP
#define MMWF_NEURAL_LAYERS_HPP

#include "Tensor.hpp"
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace MMWF {
namespace ML {

/// Parameter tensors keyed by a dotted path ("encoder.grid_embed.dense0.weight")
using NamedParameters = std::vector<std::pair<std::string, Tensor*>>;
using ConstNamedParameters = std::vector<std::pair<std::string, const Tensor*>>;

// =============================================================================
// Linear
// =============================================================================

/**
 * @brief Fully connected layer, weight stored as [out_features, in_features]
 */
class Linear {
public:
    Linear(int in_features, int out_features, bool bias = true);

    /**
     * @brief y = x W^T + b over the last axis; leading axes are kept
     * @throws std::invalid_argument if the last axis is not in_features
     */
    Tensor forward(const Tensor& x) const;

    /**
     * @brief Initialise weights ("linear", "xavier", "kaiming", "trunc_normal")
     */
    void initWeights(const std::string& method, std::mt19937& rng);

    int inFeatures() const { return weight.shape[1]; }
    int outFeatures() const { return weight.shape[0]; }

    Tensor weight;      // [out, in]
    Tensor bias_vec;    // [out]
    bool has_bias;
};

// =============================================================================
// LayerNorm
// =============================================================================

/**
 * @brief Layer normalization over the last axis
 */
class LayerNorm {
public:
    LayerNorm(int normalized_shape, double eps = 1e-5);

    Tensor forward(const Tensor& x) const;

    Tensor gamma;  // Scale
    Tensor beta;   // Shift

    int normalized_shape;
    double eps;
};

// =============================================================================
// MLP
// =============================================================================

/**
 * @brief Configuration for an MLP block
 */
struct MLPConfig {
    std::vector<int> layer_sizes;       // Including input and output
    std::string activation = "silu";    // relu, gelu, tanh, silu/swish, identity
    bool use_layer_norm = true;         // LayerNorm on the output
    std::string weight_init = "linear"; // linear, xavier, kaiming, trunc_normal
};

/**
 * @brief Multi-layer perceptron (activation between dense layers only)
 */
class MLPModel {
public:
    MLPModel(const MLPConfig& config, std::mt19937& rng);

    Tensor forward(const Tensor& x) const;

    NamedParameters namedParameters(const std::string& prefix);
    ConstNamedParameters namedParameters(const std::string& prefix) const;

    size_t numParameters() const;
    void summary(const std::string& name) const;

    int inputDim() const { return config_.layer_sizes.front(); }
    int outputDim() const { return config_.layer_sizes.back(); }
    const MLPConfig& config() const { return config_; }

    Linear& dense(size_t i) { return *dense_layers_[i]; }
    size_t numDense() const { return dense_layers_.size(); }
    LayerNorm* layerNorm() { return layer_norm_.get(); }

private:
    MLPConfig config_;
    std::vector<std::unique_ptr<Linear>> dense_layers_;
    std::unique_ptr<LayerNorm> layer_norm_;
    Activation::ActivationFn activation_fn_;
};

} // namespace ML
} // namespace MMWF

#endif // MMWF_NEURAL_LAYERS_HPP
