/**
 * @file ForecastSession.cpp
 * @brief Evaluation run driven by a configuration file
 */

#include "ForecastSession.hpp"
#include "ConfigReader.hpp"
#include "ForecastErrors.hpp"
#include "PetscTensorIO.hpp"
#include <sstream>

namespace MMWF {

ForecastSession::ForecastSession(MPI_Comm comm_in) : comm(comm_in) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

PetscErrorCode ForecastSession::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    // Throws ConfigurationError listing every invalid setting
    ForecastConfig cfg = reader.parseForecastConfig();

    ierr = initialize(cfg); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode ForecastSession::initialize(const ForecastConfig& cfg) {
    PetscFunctionBeginUser;

    config_ = cfg;
    double t0 = MPI_Wtime();

    // Static graphs, built once and shared by every forward pass
    PetscPrintf(comm, "Building graphs (mesh_size = %d, resolution = %g deg)...\n",
                config_.graph.mesh_size, config_.graph.resolution);
    graphs_ = GraphBuilder::build(config_.graph, config_.verbose && rank == 0);
    if (config_.verbose && rank == 0) {
        graphs_->summary();
    }

    // Normalisation statistics
    auto stats = StatisticsIO::load(config_.data.mean_path, config_.data.stddev_path,
                                    config_.data.stddev_diffs_path,
                                    config_.data.forcing_mean_path,
                                    config_.data.forcing_stddev_path);
    if (stats->numVariables() != config_.model.node_output_dim) {
        throw DataError("statistics describe " + std::to_string(stats->numVariables()) +
                        " variables, MODEL.node_output_dim = " +
                        std::to_string(config_.model.node_output_dim));
    }
    if (stats->numForcings() != 0 && stats->numForcings() != config_.model.forcing_dim) {
        throw DataError("forcing statistics describe " + std::to_string(stats->numForcings()) +
                        " forcings, MODEL.forcing_dim = " +
                        std::to_string(config_.model.forcing_dim));
    }
    normalizer_ = std::make_shared<FeatureNormalizer>(stats, config_.data.stddev_epsilon);
    PetscPrintf(comm, "Loaded statistics for %d variables, %d forcings\n",
                stats->numVariables(), stats->numForcings());

    // Model and pretrained weights
    auto model = std::make_shared<ForecastModel>(config_.model, graphs_, config_.seed);
    if (config_.eval.pretrained_model_path.empty()) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "EVAL.pretrained_model_path is required for evaluation");
    }
    ModelCheckpoint::load(*model, config_.eval.pretrained_model_path);
    PetscPrintf(comm, "Loaded weights from %s (%lu parameters)\n",
                config_.eval.pretrained_model_path.c_str(),
                static_cast<unsigned long>(model->numParameters()));
    if (config_.verbose && rank == 0) {
        model->summary();
    }
    model_ = model;

    PetscPrintf(comm, "Initialization took %.2f s\n", MPI_Wtime() - t0);
    PetscFunctionReturn(0);
}

PetscErrorCode ForecastSession::loadInitialState(const std::string& state_file,
                                                 const std::string& forcing_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!model_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "Session must be initialized before loading a state");
    }
    const ModelConfig& mc = config_.model;
    const int h = mc.history_length;

    ML::Tensor state;
    ierr = PetscTensorIO::readTensor(comm, state_file, state); CHKERRQ(ierr);
    PetscPrintf(comm, "Read initial state %s from %s\n", state.shapeString().c_str(),
                state_file.c_str());

    // Normalise to [B, H, N, V]
    if (state.dim() == 2 && h == 1) {
        state = state.reshape({1, 1, state.shape[0], state.shape[1]});
    } else if (state.dim() == 3) {
        state = state.reshape({1, state.shape[0], state.shape[1], state.shape[2]});
    }
    if (state.dim() != 4 || state.shape[1] != h) {
        SETERRQ(comm, PETSC_ERR_FILE_UNEXPECTED,
                "Initial state must hold history_length = %d states", h);
    }

    std::vector<std::vector<ML::Tensor>> histories;
    for (int b = 0; b < state.shape[0]; ++b) {
        ML::Tensor element = state.slice(b);
        std::vector<ML::Tensor> history;
        for (int t = 0; t < h; ++t) {
            history.push_back(element.slice(t));
        }
        histories.push_back(std::move(history));
    }

    std::vector<ML::Tensor> forcings;
    if (!forcing_file.empty()) {
        ML::Tensor f;
        ierr = PetscTensorIO::readTensor(comm, forcing_file, f); CHKERRQ(ierr);
        if (f.dim() == 2) {
            forcings.assign(histories.size(), f);
        } else if (f.dim() == 3 && f.shape[0] == static_cast<int>(histories.size())) {
            for (int b = 0; b < f.shape[0]; ++b) forcings.push_back(f.slice(b));
        } else {
            SETERRQ(comm, PETSC_ERR_FILE_UNEXPECTED,
                    "Forcings must be [N, F] or [B, N, F] with B matching the state");
        }
    } else if (mc.forcing_dim > 0) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG,
                "Model expects %d forcing channels but no forcing file was given",
                mc.forcing_dim);
    } else {
        forcings.assign(histories.size(), ML::Tensor());
    }

    if (static_cast<int>(histories.size()) != config_.eval.batch_size) {
        PetscPrintf(comm, "Warning: state holds %d batch elements, EVAL.batch_size = %d\n",
                    static_cast<int>(histories.size()), config_.eval.batch_size);
    }

    setInitialState(histories, forcings);
    PetscFunctionReturn(0);
}

void ForecastSession::setInitialState(const std::vector<std::vector<ML::Tensor>>& histories,
                                      const std::vector<ML::Tensor>& forcings) {
    if (histories.size() != forcings.size()) {
        throw DataError("need one forcing tensor per batch element");
    }
    histories_ = histories;
    forcings_ = forcings;
    trajectories_.assign(histories_.size(), {});
    failures_.assign(histories_.size(), "");
}

PetscErrorCode ForecastSession::run(int steps) {
    PetscFunctionBeginUser;

    if (!model_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "Session must be initialized before running");
    }
    if (histories_.empty()) {
        SETERRQ(comm, PETSC_ERR_ORDER, "No initial state loaded");
    }
    const int horizon = steps > 0 ? steps : config_.eval.forecast_steps;

    PetscPrintf(comm, "\nRunning %d-step forecast for %d batch element(s)\n",
                horizon, batchSize());
    double t0 = MPI_Wtime();

    for (int b = 0; b < batchSize(); ++b) {
        trajectories_[b].clear();
        failures_[b].clear();

        try {
            RolloutDriver driver(model_, normalizer_, config_.verbose && rank == 0);
            driver.initialize(histories_[b], forcings_[b], horizon);
            trajectories_[b] = driver.run();
            PetscPrintf(comm, "  element %d: %d steps completed\n", b, driver.stepsTaken());
        } catch (const RolloutError& e) {
            failures_[b] = e.what();
            PetscPrintf(comm, "  element %d: failed at step %d: %s\n", b, e.step(), e.what());
        } catch (const ForecastError& e) {
            failures_[b] = e.what();
            PetscPrintf(comm, "  element %d: rejected: %s\n", b, e.what());
        }
    }

    PetscPrintf(comm, "Forecast took %.2f s (%d of %d element(s) failed)\n",
                MPI_Wtime() - t0, numFailed(), batchSize());
    PetscFunctionReturn(0);
}

int ForecastSession::numFailed() const {
    int failed = 0;
    for (const auto& f : failures_) {
        if (!f.empty()) failed++;
    }
    return failed;
}

PetscErrorCode ForecastSession::writeOutput(const std::string& prefix) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    for (int b = 0; b < batchSize(); ++b) {
        if (!failures_[b].empty() || trajectories_[b].empty()) continue;

        std::ostringstream path;
        path << prefix << "_member" << b << ".bin";
        ML::Tensor stacked = ML::stack(trajectories_[b]);
        ierr = PetscTensorIO::writeTensor(comm, stacked, path.str()); CHKERRQ(ierr);
        PetscPrintf(comm, "Wrote %s %s\n", path.str().c_str(), stacked.shapeString().c_str());
    }
    PetscFunctionReturn(0);
}

} // namespace MMWF
