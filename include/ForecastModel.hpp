/**
 * @file ForecastModel.hpp
 * @brief Multi-mesh forecast network and its weight checkpoints
 *
 * The model maps a normalised grid state [N, grid_node_dim] to a normalised
 * increment [N, node_output_dim]. It owns the encoder, processor and decoder
 * weights and shares the static graphs read-only; forward passes are const
 * and allocate their own latents, so concurrent calls are safe.
 */

#ifndef MMWF_FORECAST_MODEL_HPP
#define MMWF_FORECAST_MODEL_HPP

#include "GraphNetwork.hpp"
#include <memory>
#include <string>
#include <vector>

namespace MMWF {

class ForecastModel {
public:
    /**
     * @throws ConfigurationError if the dimensions disagree with the graphs
     */
    ForecastModel(const ModelConfig& config, std::shared_ptr<const ForecastGraphs> graphs,
                  unsigned int seed = 2024);

    /**
     * @brief One encode-process-decode pass
     * @param normalized [grid_node_num, grid_node_dim]
     * @return [grid_node_num, node_output_dim] normalised increment
     * @throws DataError on a shape mismatch, NumericError on non-finite values
     */
    ML::Tensor forward(const ML::Tensor& normalized) const;

    /// [B, N, D] -> [B, N, V]; each element runs with its own buffers
    ML::Tensor forwardBatch(const ML::Tensor& batch) const;

    ML::NamedParameters namedParameters();
    ML::ConstNamedParameters namedParameters() const;
    size_t numParameters() const;
    void summary() const;

    /// Configuration problems of `config` against `graphs` (empty if consistent)
    static std::vector<std::string> checkDimensions(const ModelConfig& config,
                                                    const ForecastGraphs& graphs);

    const ModelConfig& config() const { return config_; }
    const ForecastGraphs& graphs() const { return *graphs_; }
    std::shared_ptr<const ForecastGraphs> sharedGraphs() const { return graphs_; }

    Encoder& encoder() { return *encoder_; }
    Processor& processor() { return *processor_; }
    Decoder& decoder() { return *decoder_; }
    const Processor& processor() const { return *processor_; }

private:
    ModelConfig config_;
    std::shared_ptr<const ForecastGraphs> graphs_;
    ML::Tensor mesh_features_;      // Static placeholder input [M, mesh_node_dim]

    std::unique_ptr<Encoder> encoder_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Decoder> decoder_;
};

/**
 * @brief Binary weight file: magic, version, then named tensors
 */
class ModelCheckpoint {
public:
    static constexpr unsigned int VERSION = 1;

    /// @throws DataError if the file cannot be written
    static void save(const ForecastModel& model, const std::string& path);

    /**
     * @brief Load every parameter of `model` from `path`
     *
     * @throws ConfigurationError if path is empty (no trained weights given)
     * @throws DataError for a missing file, bad magic/version, a missing or
     *         unexpected tensor name, or a shape mismatch
     */
    static void load(ForecastModel& model, const std::string& path);
};

} // namespace MMWF

#endif // MMWF_FORECAST_MODEL_HPP
