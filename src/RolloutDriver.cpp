/**
 * @file RolloutDriver.cpp
 * @brief Autoregressive rollout state machine
 */

#include "RolloutDriver.hpp"
#include "ForecastErrors.hpp"
#include <iostream>

namespace MMWF {

std::string rolloutStateName(RolloutState state) {
    switch (state) {
        case RolloutState::UNINITIALIZED: return "UNINITIALIZED";
        case RolloutState::INITIALIZED:   return "INITIALIZED";
        case RolloutState::STEPPING:      return "STEPPING";
        case RolloutState::TERMINAL:      return "TERMINAL";
    }
    return "UNKNOWN";
}

RolloutDriver::RolloutDriver(std::shared_ptr<const ForecastModel> model,
                             std::shared_ptr<const FeatureNormalizer> normalizer,
                             bool verbose)
    : model_(std::move(model)), normalizer_(std::move(normalizer)), verbose_(verbose) {
    if (!model_ || !normalizer_) {
        throw ConfigurationError("rollout needs a model and a normalizer");
    }

    const ModelConfig& cfg = model_->config();
    history_length_ = cfg.history_length;
    num_vars_ = cfg.node_output_dim;
    forcing_dim_ = cfg.forcing_dim;

    if (normalizer_->numVariables() != num_vars_) {
        throw ConfigurationError("statistics describe " +
                                 std::to_string(normalizer_->numVariables()) +
                                 " variables, model predicts " + std::to_string(num_vars_));
    }
    if (history_length_ < 1 || forcing_dim_ < 0 ||
        cfg.grid_node_dim != history_length_ * num_vars_ + forcing_dim_) {
        throw ConfigurationError("grid_node_dim (" + std::to_string(cfg.grid_node_dim) +
                                 ") must equal history_length * node_output_dim + forcing_dim");
    }
    const int stat_forcings = normalizer_->statistics().numForcings();
    if (stat_forcings != 0 && stat_forcings != forcing_dim_) {
        throw ConfigurationError("forcing statistics describe " + std::to_string(stat_forcings) +
                                 " forcings, model expects " + std::to_string(forcing_dim_));
    }
}

void RolloutDriver::initialize(const std::vector<ML::Tensor>& history,
                               const ML::Tensor& forcings, int horizon) {
    if (horizon <= 0) {
        throw ConfigurationError("rollout horizon must be positive");
    }
    if (static_cast<int>(history.size()) != history_length_) {
        throw DataError("rollout needs " + std::to_string(history_length_) +
                        " history states, got " + std::to_string(history.size()));
    }

    const int n = model_->config().grid_node_num;
    for (const auto& h : history) {
        if (h.dim() != 2 || h.rows() != n || h.cols() != num_vars_) {
            throw DataError("history state must be [" + std::to_string(n) + ", " +
                            std::to_string(num_vars_) + "], got " + h.shapeString());
        }
        if (!h.allFinite()) {
            throw DataError("history state contains non-finite values");
        }
    }
    if (forcing_dim_ > 0 &&
        (forcings.dim() != 2 || forcings.rows() != n || forcings.cols() != forcing_dim_)) {
        throw DataError("forcings must be [" + std::to_string(n) + ", " +
                        std::to_string(forcing_dim_) + "], got " + forcings.shapeString());
    }

    history_ = history;
    forcings_ = forcings;
    horizon_ = horizon;
    steps_ = 0;
    cancel_requested_ = false;
    state_ = RolloutState::INITIALIZED;
}

const ML::Tensor& RolloutDriver::currentState() const {
    if (history_.empty()) {
        throw RolloutError(steps_, "rollout has no state");
    }
    return history_.back();
}

ML::Tensor RolloutDriver::buildInput(const ML::Tensor& raw_forcings) const {
    std::vector<ML::Tensor> parts;
    parts.reserve(history_.size() + 1);
    for (const auto& h : history_) {
        parts.push_back(normalizer_->normalize(h));
    }
    if (forcing_dim_ > 0) {
        parts.push_back(normalizer_->normalizeForcings(raw_forcings));
    }

    std::vector<const ML::Tensor*> ptrs;
    for (const auto& p : parts) ptrs.push_back(&p);
    return ML::concatColumns(ptrs);
}

ML::Tensor RolloutDriver::advance() {
    ML::Tensor raw_forcings = forcings_;
    if (forcing_provider_) {
        raw_forcings = forcing_provider_(steps_);
        if (forcing_dim_ > 0 && (raw_forcings.rows() != forcings_.rows() ||
                                 raw_forcings.cols() != forcing_dim_)) {
            throw DataError("forcing provider returned " + raw_forcings.shapeString());
        }
    }

    ML::Tensor input = buildInput(raw_forcings);
    ML::Tensor increment = normalizer_->denormalizeIncrement(model_->forward(input));

    ML::Tensor next = history_.back() + increment;
    if (!next.allFinite()) {
        throw NumericError("updated state contains non-finite values");
    }
    return next;
}

ML::Tensor RolloutDriver::step() {
    RolloutState current = state_.load();
    if (current == RolloutState::UNINITIALIZED) {
        throw RolloutError(steps_, "rollout has not been initialized");
    }
    if (current == RolloutState::TERMINAL) {
        throw RolloutError(steps_, "rollout is terminal");
    }
    if (cancel_requested_) {
        state_ = RolloutState::TERMINAL;
        throw RolloutError(steps_, "rollout was cancelled");
    }

    in_step_ = true;
    state_ = RolloutState::STEPPING;

    ML::Tensor next;
    try {
        next = advance();
    } catch (const std::exception& e) {
        // The autoregressive state is no longer trustworthy
        history_.clear();
        in_step_ = false;
        state_ = RolloutState::TERMINAL;
        throw RolloutError(steps_, e.what());
    }

    history_.erase(history_.begin());
    history_.push_back(next);
    steps_++;
    in_step_ = false;

    if (verbose_) {
        std::cout << "Rollout step " << steps_ << "/" << horizon_ << " done" << std::endl;
    }

    if (steps_ >= horizon_ || cancel_requested_) {
        state_ = RolloutState::TERMINAL;
    }
    return next;
}

std::vector<ML::Tensor> RolloutDriver::run() {
    std::vector<ML::Tensor> trajectory;
    trajectory.reserve(horizon_ - steps_);

    while (state_.load() != RolloutState::TERMINAL) {
        trajectory.push_back(step());
    }

    if (steps_ < horizon_) {
        throw RolloutError(steps_, "rollout was cancelled before reaching the horizon");
    }
    return trajectory;
}

void RolloutDriver::cancel() {
    cancel_requested_ = true;
    if (!in_step_ && state_.load() != RolloutState::UNINITIALIZED) {
        state_ = RolloutState::TERMINAL;
    }
}

} // namespace MMWF
