/**
 * @file Tensor.cpp
 * @brief Implementation of the dense tensor and activations
 */

#include "Tensor.hpp"
#include "ForecastErrors.hpp"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <sstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace MMWF {
namespace ML {

namespace {

size_t product(const std::vector<int>& shape) {
    size_t n = 1;
    for (int s : shape) {
        if (s < 0) {
            throw std::invalid_argument("Tensor: negative dimension in shape");
        }
        n *= static_cast<size_t>(s);
    }
    return n;
}

void requireSameShape(const Tensor& a, const Tensor& b, const char* op) {
    if (a.shape != b.shape) {
        throw std::invalid_argument(std::string("Tensor ") + op + ": shape mismatch " +
                                    a.shapeString() + " vs " + b.shapeString());
    }
}

} // namespace

// =============================================================================
// Tensor Implementation
// =============================================================================

Tensor::Tensor(const std::vector<int>& shape) : data(product(shape), 0.0), shape(shape) {}

Tensor::Tensor(const std::vector<int>& shape, double value)
    : data(product(shape), value), shape(shape) {}

Tensor::Tensor(const std::vector<int>& shape, const std::vector<double>& data)
    : data(data), shape(shape) {
    if (data.size() != product(shape)) {
        throw std::invalid_argument("Tensor: data size does not match shape " + shapeString());
    }
}

size_t Tensor::size() const {
    return data.size();
}

size_t Tensor::numel() const {
    return product(shape);
}

double& Tensor::operator()(int i) {
    return data[i];
}

double& Tensor::operator()(int i, int j) {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

double& Tensor::operator()(int i, int j, int k) {
    return data[(static_cast<size_t>(i) * shape[1] + j) * shape[2] + k];
}

const double& Tensor::operator()(int i) const {
    return data[i];
}

const double& Tensor::operator()(int i, int j) const {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

const double& Tensor::operator()(int i, int j, int k) const {
    return data[(static_cast<size_t>(i) * shape[1] + j) * shape[2] + k];
}

Tensor Tensor::reshape(const std::vector<int>& new_shape) const {
    if (product(new_shape) != data.size()) {
        throw std::invalid_argument("Tensor::reshape: element count mismatch");
    }
    Tensor result;
    result.data = data;
    result.shape = new_shape;
    return result;
}

Tensor Tensor::slice(int b) const {
    if (shape.size() < 2 || b < 0 || b >= shape[0]) {
        throw std::out_of_range("Tensor::slice: index out of range for " + shapeString());
    }
    std::vector<int> sub_shape(shape.begin() + 1, shape.end());
    size_t n = product(sub_shape);
    Tensor result(sub_shape);
    std::copy(data.begin() + b * n, data.begin() + (b + 1) * n, result.data.begin());
    return result;
}

Tensor Tensor::operator+(const Tensor& other) const {
    requireSameShape(*this, other, "operator+");
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] + other.data[i];
    }
    return result;
}

Tensor Tensor::operator-(const Tensor& other) const {
    requireSameShape(*this, other, "operator-");
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] - other.data[i];
    }
    return result;
}

Tensor Tensor::operator*(const Tensor& other) const {
    requireSameShape(*this, other, "operator*");
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] * other.data[i];
    }
    return result;
}

Tensor Tensor::operator*(double scalar) const {
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] * scalar;
    }
    return result;
}

Tensor& Tensor::operator+=(const Tensor& other) {
    requireSameShape(*this, other, "operator+=");
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] += other.data[i];
    }
    return *this;
}

double Tensor::sum() const {
    return std::accumulate(data.begin(), data.end(), 0.0);
}

double Tensor::mean() const {
    return data.empty() ? 0.0 : sum() / data.size();
}

double Tensor::max() const {
    return *std::max_element(data.begin(), data.end());
}

double Tensor::min() const {
    return *std::min_element(data.begin(), data.end());
}

double Tensor::norm() const {
    double sum_sq = 0.0;
    for (double x : data) sum_sq += x * x;
    return std::sqrt(sum_sq);
}

double Tensor::maxAbsDiff(const Tensor& other) const {
    requireSameShape(*this, other, "maxAbsDiff");
    double diff = 0.0;
    for (size_t i = 0; i < data.size(); ++i) {
        diff = std::max(diff, std::abs(data[i] - other.data[i]));
    }
    return diff;
}

bool Tensor::allFinite() const {
    for (double x : data) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

std::string Tensor::shapeString() const {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << shape[i];
    }
    ss << "]";
    return ss.str();
}

void Tensor::zeros() {
    std::fill(data.begin(), data.end(), 0.0);
}

void Tensor::ones() {
    std::fill(data.begin(), data.end(), 1.0);
}

void Tensor::fill(double value) {
    std::fill(data.begin(), data.end(), value);
}

void Tensor::write(std::ostream& out) const {
    int ndim = shape.size();
    out.write(reinterpret_cast<const char*>(&ndim), sizeof(int));
    out.write(reinterpret_cast<const char*>(shape.data()), ndim * sizeof(int));
    size_t n = data.size();
    out.write(reinterpret_cast<const char*>(&n), sizeof(size_t));
    out.write(reinterpret_cast<const char*>(data.data()), n * sizeof(double));
    if (!out) {
        throw DataError("failed writing tensor " + shapeString());
    }
}

void Tensor::read(std::istream& in) {
    int ndim = 0;
    in.read(reinterpret_cast<char*>(&ndim), sizeof(int));
    if (!in || ndim < 0 || ndim > 8) {
        throw DataError("corrupt tensor header");
    }
    shape.resize(ndim);
    in.read(reinterpret_cast<char*>(shape.data()), ndim * sizeof(int));
    size_t n = 0;
    in.read(reinterpret_cast<char*>(&n), sizeof(size_t));
    if (!in) {
        throw DataError("truncated tensor header");
    }
    for (int s : shape) {
        if (s < 0) throw DataError("negative dimension in stored tensor");
    }
    if (n != product(shape)) {
        throw DataError("stored tensor size does not match its shape " + shapeString());
    }
    if (n > data.max_size()) {
        throw DataError("stored tensor " + shapeString() + " is too large");
    }

    // The element count must fit in what is left of a seekable stream
    std::streampos here = in.tellg();
    if (here != std::streampos(-1)) {
        in.seekg(0, std::ios::end);
        std::streampos end = in.tellg();
        in.seekg(here);
        if (!in || end < here ||
            n > static_cast<size_t>(end - here) / sizeof(double)) {
            throw DataError("stored tensor " + shapeString() + " is larger than the file");
        }
    }
    data.resize(n);
    in.read(reinterpret_cast<char*>(data.data()), n * sizeof(double));
    if (!in) {
        throw DataError("truncated tensor data for shape " + shapeString());
    }
}

// =============================================================================
// Row operations
// =============================================================================

Tensor gatherRows(const Tensor& src, const std::vector<int>& index) {
    const int width = src.cols();
    const int n = index.size();
    Tensor result({n, width});

    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
        const double* from = src.row(index[i]);
        std::copy(from, from + width, result.row(i));
    }
    return result;
}

Tensor concatColumns(const std::vector<const Tensor*>& parts) {
    if (parts.empty()) {
        throw std::invalid_argument("concatColumns: nothing to concatenate");
    }
    const int n = parts[0]->rows();
    int total = 0;
    for (const Tensor* p : parts) {
        if (p->rows() != n) {
            throw std::invalid_argument("concatColumns: row count mismatch " +
                                        parts[0]->shapeString() + " vs " + p->shapeString());
        }
        total += p->cols();
    }

    Tensor result({n, total});

    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
        double* out = result.row(i);
        for (const Tensor* p : parts) {
            const double* in = p->row(i);
            out = std::copy(in, in + p->cols(), out);
        }
    }
    return result;
}

Tensor stack(const std::vector<Tensor>& items) {
    if (items.empty()) {
        throw std::invalid_argument("stack: nothing to stack");
    }
    std::vector<int> shape = items[0].shape;
    shape.insert(shape.begin(), static_cast<int>(items.size()));
    Tensor result(shape);

    size_t offset = 0;
    for (const auto& item : items) {
        if (item.shape != items[0].shape) {
            throw std::invalid_argument("stack: shape mismatch");
        }
        std::copy(item.data.begin(), item.data.end(), result.data.begin() + offset);
        offset += item.data.size();
    }
    return result;
}

// =============================================================================
// Activation Functions
// =============================================================================

namespace Activation {

Tensor relu(const Tensor& x) {
    Tensor result(x.shape);
    for (size_t i = 0; i < x.data.size(); ++i) {
        result.data[i] = std::max(0.0, x.data[i]);
    }
    return result;
}

Tensor gelu(const Tensor& x) {
    // GELU(x) = 0.5 * x * (1 + tanh(sqrt(2/pi) * (x + 0.044715 * x^3)))
    static const double sqrt_2_pi = std::sqrt(2.0 / M_PI);
    Tensor result(x.shape);
    for (size_t i = 0; i < x.data.size(); ++i) {
        double xi = x.data[i];
        double inner = sqrt_2_pi * (xi + 0.044715 * xi * xi * xi);
        result.data[i] = 0.5 * xi * (1.0 + std::tanh(inner));
    }
    return result;
}

Tensor silu(const Tensor& x) {
    // SiLU(x) = x * sigmoid(x)
    Tensor result(x.shape);
    for (size_t i = 0; i < x.data.size(); ++i) {
        double xi = x.data[i];
        result.data[i] = xi / (1.0 + std::exp(-xi));
    }
    return result;
}

Tensor tanh(const Tensor& x) {
    Tensor result(x.shape);
    for (size_t i = 0; i < x.data.size(); ++i) {
        result.data[i] = std::tanh(x.data[i]);
    }
    return result;
}

Tensor identity(const Tensor& x) {
    return x;
}

ActivationFn getActivation(const std::string& name) {
    if (name == "relu") return relu;
    if (name == "gelu") return gelu;
    if (name == "silu" || name == "swish") return silu;
    if (name == "tanh") return tanh;
    if (name == "identity" || name == "linear") return identity;
    throw std::invalid_argument("Unknown activation: " + name);
}

} // namespace Activation

} // namespace ML
} // namespace MMWF
