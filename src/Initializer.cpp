/**
 * @file Initializer.cpp
 * @brief Implementation of weight initialisation schemes
 */

#include "Initializer.hpp"
#include <cmath>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace MMWF {
namespace ML {
namespace Init {

namespace {

double normCdf(double x) {
    return (1.0 + std::erf(x / std::sqrt(2.0))) / 2.0;
}

double correctFan(const Tensor& tensor, FanMode mode, bool reverse) {
    auto fans = calculateFanInFanOut(tensor, reverse);
    return mode == FanMode::FAN_IN ? fans.first : fans.second;
}

} // namespace

std::pair<double, double> calculateFanInFanOut(const Tensor& tensor, bool reverse) {
    if (tensor.dim() < 2) {
        throw std::invalid_argument("calculateFanInFanOut: tensor.ndim should be no less than 2, got " +
                                    std::to_string(tensor.dim()));
    }

    int num_input_fmaps = reverse ? tensor.shape[0] : tensor.shape[1];
    int num_output_fmaps = reverse ? tensor.shape[1] : tensor.shape[0];

    double receptive_field_size = 1.0;
    for (int d = 2; d < tensor.dim(); ++d) {
        receptive_field_size *= tensor.shape[d];
    }

    return {num_input_fmaps * receptive_field_size, num_output_fmaps * receptive_field_size};
}

double calculateGain(const std::string& nonlinearity) {
    if (nonlinearity == "leaky_relu") {
        return calculateGain(nonlinearity, 0.01);
    }
    return calculateGain(nonlinearity, 0.0);
}

double calculateGain(const std::string& nonlinearity, double negative_slope) {
    if (nonlinearity == "linear" || nonlinearity == "sigmoid" || nonlinearity == "identity") {
        return 1.0;
    }
    if (nonlinearity == "tanh") {
        return 5.0 / 3.0;
    }
    if (nonlinearity == "relu") {
        return std::sqrt(2.0);
    }
    if (nonlinearity == "leaky_relu") {
        return std::sqrt(2.0 / (1.0 + negative_slope * negative_slope));
    }
    if (nonlinearity == "selu") {
        return 3.0 / 4.0;
    }
    throw std::invalid_argument("Unsupported nonlinearity " + nonlinearity);
}

void uniform(Tensor& tensor, double a, double b, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(a, b);
    for (double& x : tensor.data) x = dist(rng);
}

void normal(Tensor& tensor, double mean, double stddev, std::mt19937& rng) {
    std::normal_distribution<double> dist(mean, stddev);
    for (double& x : tensor.data) x = dist(rng);
}

void truncNormal(Tensor& tensor, double mean, double stddev, double a, double b,
                 std::mt19937& rng) {
    if (mean < a - 2 * stddev || mean > b + 2 * stddev) {
        std::cerr << "Warning: mean(" << mean << ") is more than 2 std(" << stddev
                  << ") from [a, b]([" << a << ", " << b
                  << "]) in truncNormal. The distribution of values may be incorrect." << std::endl;
    }

    // Uniform on [2l-1, 2u-1], then inverse CDF of the standard normal
    double l = normCdf((a - mean) / stddev);
    double u = normCdf((b - mean) / stddev);
    std::uniform_real_distribution<double> dist(2 * l - 1, 2 * u - 1);

    for (double& x : tensor.data) {
        double v = erfinv(dist(rng));
        v = v * stddev * std::sqrt(2.0) + mean;
        x = std::min(std::max(v, a), b);
    }
}

void constant(Tensor& tensor, double value) {
    tensor.fill(value);
}

void ones(Tensor& tensor) {
    tensor.ones();
}

void zeros(Tensor& tensor) {
    tensor.zeros();
}

void xavierUniform(Tensor& tensor, std::mt19937& rng, double gain, bool reverse) {
    auto fans = calculateFanInFanOut(tensor, reverse);
    double stddev = gain * std::sqrt(2.0 / (fans.first + fans.second));
    double k = std::sqrt(3.0) * stddev;
    uniform(tensor, -k, k, rng);
}

void xavierNormal(Tensor& tensor, std::mt19937& rng, double gain, bool reverse) {
    auto fans = calculateFanInFanOut(tensor, reverse);
    double stddev = gain * std::sqrt(2.0 / (fans.first + fans.second));
    normal(tensor, 0.0, stddev, rng);
}

void kaimingUniform(Tensor& tensor, std::mt19937& rng, double a, FanMode mode,
                    const std::string& nonlinearity, bool reverse) {
    double fan = correctFan(tensor, mode, reverse);
    double gain = calculateGain(nonlinearity, a);
    double stddev = gain / std::sqrt(fan);
    double k = std::sqrt(3.0) * stddev;
    uniform(tensor, -k, k, rng);
}

void kaimingNormal(Tensor& tensor, std::mt19937& rng, double a, FanMode mode,
                   const std::string& nonlinearity, bool reverse) {
    double fan = correctFan(tensor, mode, reverse);
    double gain = calculateGain(nonlinearity, a);
    double stddev = gain / std::sqrt(fan);
    normal(tensor, 0.0, stddev, rng);
}

void linearInit(Tensor& weight, Tensor* bias, std::mt19937& rng) {
    double fan_in = calculateFanInFanOut(weight).first;
    double bound = 1.0 / std::sqrt(fan_in);
    uniform(weight, -bound, bound, rng);
    if (bias) {
        uniform(*bias, -bound, bound, rng);
    }
}

double erfinv(double y) {
    if (y <= -1.0) return -HUGE_VAL;
    if (y >= 1.0) return HUGE_VAL;

    // Initial guess (Winitzki approximation), then Newton refinement
    const double a = 0.147;
    double ln = std::log(1.0 - y * y);
    double t = 2.0 / (M_PI * a) + ln / 2.0;
    double x = std::copysign(std::sqrt(std::sqrt(t * t - ln / a) - t), y);

    const double two_over_sqrt_pi = 2.0 / std::sqrt(M_PI);
    for (int iter = 0; iter < 4; ++iter) {
        double err = std::erf(x) - y;
        x -= err / (two_over_sqrt_pi * std::exp(-x * x));
    }
    return x;
}

} // namespace Init
} // namespace ML
} // namespace MMWF
