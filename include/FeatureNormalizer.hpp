/**
 * @file FeatureNormalizer.hpp
 * @brief Per-variable normalisation statistics and their application
 *
 * The model works in normalised units: absolute fields use (mean, stddev),
 * predicted increments use the standard deviation of one-step differences.
 * Statistics are loaded once and shared read-only by every rollout step and
 * batch element.
 */

#ifndef MMWF_FEATURE_NORMALIZER_HPP
#define MMWF_FEATURE_NORMALIZER_HPP

#include "Tensor.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace MMWF {

/**
 * @brief Normalisation statistics of the predicted variables and forcings
 */
struct Statistics {
    std::vector<std::string> variables;
    std::vector<double> mean;
    std::vector<double> stddev;
    std::vector<double> stddev_diffs;

    // Optional; empty means forcings are passed through unchanged
    std::vector<std::string> forcing_variables;
    std::vector<double> forcing_mean;
    std::vector<double> forcing_stddev;

    int numVariables() const { return static_cast<int>(variables.size()); }
    int numForcings() const { return static_cast<int>(forcing_variables.size()); }

    /// @throws DataError for mismatched lengths, non-finite or negative values
    void validate() const;
};

/**
 * @brief Text statistics files: one `name value` pair per line
 *
 * Blank lines and lines starting with '#' are ignored.
 */
class StatisticsIO {
public:
    using Table = std::vector<std::pair<std::string, double>>;

    /// @throws DataError if the file is missing or a line is malformed
    static Table readTable(const std::string& path);
    static void writeTable(const std::string& path, const Table& table);

    /**
     * @brief Load mean / stddev / stddev-of-differences files
     *
     * The three files must list the same variables in the same order.
     */
    static std::shared_ptr<const Statistics> load(const std::string& mean_path,
                                                  const std::string& stddev_path,
                                                  const std::string& diffs_path);

    /// As above, plus forcing statistics (either path may be empty to skip)
    static std::shared_ptr<const Statistics> load(const std::string& mean_path,
                                                  const std::string& stddev_path,
                                                  const std::string& diffs_path,
                                                  const std::string& forcing_mean_path,
                                                  const std::string& forcing_stddev_path);
};

/**
 * @brief Applies statistics to [..., V] tensors (last axis = variable)
 *
 * Standard deviations are floored at `eps` so constant variables never
 * divide by zero.
 */
class FeatureNormalizer {
public:
    explicit FeatureNormalizer(std::shared_ptr<const Statistics> stats, double eps = 1e-8);

    /// (raw - mean) / max(stddev, eps)
    ML::Tensor normalize(const ML::Tensor& raw) const;

    /// x * max(stddev, eps) + mean
    ML::Tensor denormalize(const ML::Tensor& x) const;

    /// pred * max(stddev_diffs, eps)
    ML::Tensor denormalizeIncrement(const ML::Tensor& pred) const;

    /// Forcing normalisation; identity when no forcing statistics are loaded
    ML::Tensor normalizeForcings(const ML::Tensor& raw) const;

    double epsilon() const { return eps_; }
    const Statistics& statistics() const { return *stats_; }
    int numVariables() const { return stats_->numVariables(); }

private:
    std::shared_ptr<const Statistics> stats_;
    double eps_;
};

} // namespace MMWF

#endif // MMWF_FEATURE_NORMALIZER_HPP
