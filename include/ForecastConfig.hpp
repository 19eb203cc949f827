/**
 * @file ForecastConfig.hpp
 * @brief Typed configuration of a forecast run
 */

#ifndef MMWF_FORECAST_CONFIG_HPP
#define MMWF_FORECAST_CONFIG_HPP

#include "ForecastGraphs.hpp"
#include "GraphNetwork.hpp"
#include <string>
#include <vector>

namespace MMWF {

/**
 * @brief Statistics files and normalisation settings
 */
struct DataConfig {
    std::string mean_path;
    std::string stddev_path;
    std::string stddev_diffs_path;
    std::string forcing_mean_path;      // Optional
    std::string forcing_stddev_path;    // Optional
    double stddev_epsilon = 1e-8;       // Floor applied to every stddev
};

/**
 * @brief Evaluation settings
 */
struct EvalConfig {
    std::string pretrained_model_path;  // Required for evaluation
    int batch_size = 1;
    int forecast_steps = 1;             // Rollout horizon
    std::string output_prefix = "forecast";
};

struct ForecastConfig {
    GraphBuildConfig graph;
    ModelConfig model;
    DataConfig data;
    EvalConfig eval;

    unsigned int seed = 2024;
    bool verbose = true;

    /**
     * @brief Cross-check every section
     * @return list of problems, empty if the configuration is usable
     */
    std::vector<std::string> validate() const;
};

} // namespace MMWF

#endif // MMWF_FORECAST_CONFIG_HPP
