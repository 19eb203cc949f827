/**
 * @file ForecastSession.hpp
 * @brief Top-level evaluation run: configuration, graphs, model and rollouts
 *
 * A session reads the configuration file, builds the static graphs once,
 * loads the statistics and pretrained weights, then runs one independent
 * rollout per batch element. A failed rollout aborts only its own batch
 * element; the others still complete and are written.
 *
 * Initial-state file layouts (PETSc binary tensor files):
 *   [N, V]          single state, history_length == 1
 *   [H, N, V]       one batch element
 *   [B, H, N, V]    B batch elements
 * Forcing file layouts: [N, F] (shared by all elements) or [B, N, F].
 */

#ifndef MMWF_FORECAST_SESSION_HPP
#define MMWF_FORECAST_SESSION_HPP

#include "ForecastConfig.hpp"
#include "ForecastModel.hpp"
#include "FeatureNormalizer.hpp"
#include "RolloutDriver.hpp"
#include <petsc.h>
#include <memory>
#include <string>
#include <vector>

namespace MMWF {

class ForecastSession {
public:
    ForecastSession(MPI_Comm comm);
    ~ForecastSession() = default;

    // Initialization
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode initialize(const ForecastConfig& config);

    // Load input
    PetscErrorCode loadInitialState(const std::string& state_file,
                                    const std::string& forcing_file = "");
    void setInitialState(const std::vector<std::vector<ML::Tensor>>& histories,
                         const std::vector<ML::Tensor>& forcings);

    /**
     * @brief Roll every batch element forward
     * @param steps horizon; <= 0 uses EVAL.forecast_steps
     */
    PetscErrorCode run(int steps = 0);

    // Output: one [T, N, V] tensor file per successful batch element
    PetscErrorCode writeOutput(const std::string& prefix);

    const ForecastConfig& config() const { return config_; }
    std::shared_ptr<const ForecastModel> model() const { return model_; }
    int batchSize() const { return static_cast<int>(histories_.size()); }
    int numFailed() const;

    // Empty for a failed element
    const std::vector<ML::Tensor>& trajectory(int b) const { return trajectories_.at(b); }
    const std::string& failure(int b) const { return failures_.at(b); }

private:
    MPI_Comm comm;
    int rank, size;

    ForecastConfig config_;
    std::shared_ptr<const ForecastGraphs> graphs_;
    std::shared_ptr<const FeatureNormalizer> normalizer_;
    std::shared_ptr<const ForecastModel> model_;

    std::vector<std::vector<ML::Tensor>> histories_;
    std::vector<ML::Tensor> forcings_;

    std::vector<std::vector<ML::Tensor>> trajectories_;
    std::vector<std::string> failures_;
};

} // namespace MMWF

#endif // MMWF_FORECAST_SESSION_HPP
