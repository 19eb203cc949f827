/**
 * @file RolloutDriver.hpp
 * @brief Autoregressive multi-step forecast
 *
 * States:
 *   UNINITIALIZED --initialize--> INITIALIZED --step--> STEPPING --...--> TERMINAL
 *
 * Each step normalises the history, runs the model, converts the predicted
 * increment to physical units and adds it to the latest state; the result
 * becomes the newest history entry. The rollout ends at the horizon, on
 * cancel(), or on the first failure. A failure is reported as RolloutError
 * and leaves the driver TERMINAL; run() never returns a partial trajectory.
 *
 * Model input layout per grid node:
 *   [norm(x_{t-H+1}), ..., norm(x_t), norm(forcings_t)]
 * so grid_node_dim = history_length * node_output_dim + forcing_dim.
 */

#ifndef MMWF_ROLLOUT_DRIVER_HPP
#define MMWF_ROLLOUT_DRIVER_HPP

#include "FeatureNormalizer.hpp"
#include "ForecastModel.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace MMWF {

enum class RolloutState {
    UNINITIALIZED,
    INITIALIZED,
    STEPPING,
    TERMINAL
};

std::string rolloutStateName(RolloutState state);

/// Raw forcings [N, forcing_dim] for the given 0-based step
using ForcingProvider = std::function<ML::Tensor(int step)>;

class RolloutDriver {
public:
    /**
     * @throws ConfigurationError if the model input layout does not match
     *         history_length * variables + forcing_dim
     */
    RolloutDriver(std::shared_ptr<const ForecastModel> model,
                  std::shared_ptr<const FeatureNormalizer> normalizer,
                  bool verbose = false);

    /**
     * @brief Load the initial history (oldest first) and the horizon
     *
     * @param history  history_length physical states, each [N, V]
     * @param forcings raw forcings [N, forcing_dim], used for every step
     *                 unless a forcing provider is set
     * @param horizon  number of steps, > 0
     * @throws DataError / ConfigurationError for invalid inputs
     */
    void initialize(const std::vector<ML::Tensor>& history, const ML::Tensor& forcings,
                    int horizon);

    void setForcingProvider(ForcingProvider provider) { forcing_provider_ = std::move(provider); }

    /**
     * @brief Advance one step and return the new physical state [N, V]
     * @throws RolloutError if not steppable or if the step fails
     */
    ML::Tensor step();

    /**
     * @brief Step until the horizon; returns the states after each step
     * @throws RolloutError if any step fails or the rollout is cancelled
     */
    std::vector<ML::Tensor> run();

    /// Stop at the next step boundary
    void cancel();

    RolloutState state() const { return state_.load(); }
    int stepsTaken() const { return steps_; }
    int horizon() const { return horizon_; }
    const ML::Tensor& currentState() const;

private:
    ML::Tensor buildInput(const ML::Tensor& raw_forcings) const;
    ML::Tensor advance();

    std::shared_ptr<const ForecastModel> model_;
    std::shared_ptr<const FeatureNormalizer> normalizer_;
    bool verbose_;

    int history_length_;
    int num_vars_;
    int forcing_dim_;

    std::vector<ML::Tensor> history_;   // Physical states, oldest first
    ML::Tensor forcings_;
    ForcingProvider forcing_provider_;

    int horizon_ = 0;
    int steps_ = 0;
    std::atomic<RolloutState> state_{RolloutState::UNINITIALIZED};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> in_step_{false};
};

} // namespace MMWF

#endif // MMWF_ROLLOUT_DRIVER_HPP
