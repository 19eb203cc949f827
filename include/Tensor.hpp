/**
 * @file Tensor.hpp
 * @brief Dense row-major tensor and activation functions
 *
 * The tensor is a plain value type (shape + contiguous data). Node and edge
 * embeddings are stored as 2-D tensors [rows, features]; batched inputs add a
 * leading batch dimension.
 */

#ifndef MMWF_TENSOR_HPP
#define MMWF_TENSOR_HPP

#include <vector>
#include <string>
#include <functional>
#include <iosfwd>

namespace MMWF {
namespace ML {

// =============================================================================
// Tensor
// =============================================================================

/**
 * @brief Simple dense tensor (row-major, double precision)
 */
class Tensor {
public:
    std::vector<double> data;
    std::vector<int> shape;

    Tensor() = default;
    Tensor(const std::vector<int>& shape);
    Tensor(const std::vector<int>& shape, double value);
    Tensor(const std::vector<int>& shape, const std::vector<double>& data);

    // Basic operations
    size_t size() const;
    size_t numel() const;
    int dim() const { return shape.size(); }
    int rows() const { return shape.empty() ? 0 : shape[0]; }
    int cols() const { return shape.size() < 2 ? 1 : shape.back(); }

    // Element access
    double& operator()(int i);
    double& operator()(int i, int j);
    double& operator()(int i, int j, int k);

    const double& operator()(int i) const;
    const double& operator()(int i, int j) const;
    const double& operator()(int i, int j, int k) const;

    // Linear index
    double& at(size_t idx) { return data[idx]; }
    const double& at(size_t idx) const { return data[idx]; }

    double* row(int i) { return data.data() + static_cast<size_t>(i) * cols(); }
    const double* row(int i) const { return data.data() + static_cast<size_t>(i) * cols(); }

    // Reshape (same number of elements)
    Tensor reshape(const std::vector<int>& new_shape) const;

    // Slice along the leading dimension: element b of a batched tensor
    Tensor slice(int b) const;

    // Math operations (shapes must match)
    Tensor operator+(const Tensor& other) const;
    Tensor operator-(const Tensor& other) const;
    Tensor operator*(const Tensor& other) const;  // Element-wise
    Tensor operator*(double scalar) const;
    Tensor& operator+=(const Tensor& other);

    // Reductions
    double sum() const;
    double mean() const;
    double max() const;
    double min() const;
    double norm() const;
    double maxAbsDiff(const Tensor& other) const;

    bool allFinite() const;
    bool sameShape(const Tensor& other) const { return shape == other.shape; }
    std::string shapeString() const;

    // Initialization
    void zeros();
    void ones();
    void fill(double value);

    // Serialization (binary: ndim, shape, count, data)
    void write(std::ostream& out) const;
    void read(std::istream& in);
};

// =============================================================================
// Row operations used by message passing
// =============================================================================

/**
 * @brief Gather rows of a 2-D tensor: result[i] = src[index[i]]
 */
Tensor gatherRows(const Tensor& src, const std::vector<int>& index);

/**
 * @brief Concatenate 2-D tensors with equal row counts along the feature axis
 */
Tensor concatColumns(const std::vector<const Tensor*>& parts);

/**
 * @brief Stack equally shaped tensors along a new leading dimension
 */
Tensor stack(const std::vector<Tensor>& items);

// =============================================================================
// Activation Functions
// =============================================================================

namespace Activation {
    Tensor relu(const Tensor& x);
    Tensor gelu(const Tensor& x);
    Tensor silu(const Tensor& x);
    Tensor tanh(const Tensor& x);
    Tensor identity(const Tensor& x);

    using ActivationFn = std::function<Tensor(const Tensor&)>;

    /**
     * @brief Look up an activation by name (relu, gelu, silu/swish, tanh, identity)
     * @throws std::invalid_argument for unknown names
     */
    ActivationFn getActivation(const std::string& name);
}

} // namespace ML
} // namespace MMWF

#endif // MMWF_TENSOR_HPP
