/**
 * @file Initializer.hpp
 * @brief Weight initialisation schemes for dense layers
 *
 * Weights follow the [out_features, in_features] layout of Linear, so
 * fan_in = shape[1] and fan_out = shape[0] unless `reverse` is set.
 * Every scheme draws from a caller-owned generator so that a model built
 * with the same seed is bit-identical across runs.
 */

#ifndef MMWF_INITIALIZER_HPP
#define MMWF_INITIALIZER_HPP

#include "Tensor.hpp"
#include <random>
#include <string>
#include <utility>

namespace MMWF {
namespace ML {
namespace Init {

enum class FanMode {
    FAN_IN,
    FAN_OUT
};

/**
 * @brief (fan_in, fan_out) of a weight tensor with at least 2 dimensions
 *
 * Trailing dimensions beyond the first two count as the receptive field.
 */
std::pair<double, double> calculateFanInFanOut(const Tensor& tensor, bool reverse = false);

/**
 * @brief Recommended gain for a nonlinearity
 *
 * linear/sigmoid -> 1, tanh -> 5/3, relu -> sqrt(2),
 * leaky_relu -> sqrt(2 / (1 + slope^2)) (slope defaults to 0.01), selu -> 3/4.
 * @throws std::invalid_argument for unknown nonlinearities
 */
double calculateGain(const std::string& nonlinearity);
double calculateGain(const std::string& nonlinearity, double negative_slope);

void uniform(Tensor& tensor, double a, double b, std::mt19937& rng);
void normal(Tensor& tensor, double mean, double stddev, std::mt19937& rng);

/**
 * @brief Normal distribution truncated to [a, b] (inverse-CDF sampling)
 */
void truncNormal(Tensor& tensor, double mean, double stddev, double a, double b,
                 std::mt19937& rng);

void constant(Tensor& tensor, double value);
void ones(Tensor& tensor);
void zeros(Tensor& tensor);

void xavierUniform(Tensor& tensor, std::mt19937& rng, double gain = 1.0, bool reverse = false);
void xavierNormal(Tensor& tensor, std::mt19937& rng, double gain = 1.0, bool reverse = false);

void kaimingUniform(Tensor& tensor, std::mt19937& rng, double a = 0.0,
                    FanMode mode = FanMode::FAN_IN,
                    const std::string& nonlinearity = "leaky_relu",
                    bool reverse = false);
void kaimingNormal(Tensor& tensor, std::mt19937& rng, double a = 0.0,
                   FanMode mode = FanMode::FAN_IN,
                   const std::string& nonlinearity = "leaky_relu",
                   bool reverse = false);

/**
 * @brief Default dense-layer init: weight and bias ~ U(-1/sqrt(fan_in), 1/sqrt(fan_in))
 */
void linearInit(Tensor& weight, Tensor* bias, std::mt19937& rng);

/**
 * @brief Inverse error function (Newton iteration on std::erf)
 */
double erfinv(double y);

} // namespace Init
} // namespace ML
} // namespace MMWF

#endif // MMWF_INITIALIZER_HPP
