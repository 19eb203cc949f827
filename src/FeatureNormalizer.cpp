/**
 * @file FeatureNormalizer.cpp
 * @brief Statistics loading and (de)normalisation
 */

#include "FeatureNormalizer.hpp"
#include "ForecastErrors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace MMWF {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void requireLastAxis(const ML::Tensor& x, int n, const char* what) {
    if (x.dim() == 0 || x.shape.back() != n) {
        throw DataError(std::string(what) + ": expected " + std::to_string(n) +
                        " variables on the last axis, got " + x.shapeString());
    }
}

// y = (x - shift) / scale or y = x * scale + shift, per last-axis column
ML::Tensor affine(const ML::Tensor& x, const std::vector<double>& shift,
                  const std::vector<double>& scale, double eps, bool inverse) {
    const int v = static_cast<int>(scale.size());
    const int rows = static_cast<int>(x.numel() / std::max(v, 1));
    ML::Tensor y(x.shape);

    #pragma omp parallel for
    for (int i = 0; i < rows; ++i) {
        const double* in = x.data.data() + static_cast<size_t>(i) * v;
        double* out = y.data.data() + static_cast<size_t>(i) * v;
        for (int k = 0; k < v; ++k) {
            double s = std::max(scale[k], eps);
            double m = shift.empty() ? 0.0 : shift[k];
            out[k] = inverse ? in[k] * s + m : (in[k] - m) / s;
        }
    }
    return y;
}

std::vector<std::string> namesOf(const StatisticsIO::Table& table) {
    std::vector<std::string> names;
    for (const auto& row : table) names.push_back(row.first);
    return names;
}

std::vector<double> valuesOf(const StatisticsIO::Table& table) {
    std::vector<double> values;
    for (const auto& row : table) values.push_back(row.second);
    return values;
}

void requireSameVariables(const StatisticsIO::Table& a, const StatisticsIO::Table& b,
                          const std::string& path_a, const std::string& path_b) {
    if (namesOf(a) != namesOf(b)) {
        throw DataError("variables in " + path_b + " do not match those in " + path_a);
    }
}

} // namespace

// =============================================================================
// Statistics
// =============================================================================

void Statistics::validate() const {
    const size_t n = variables.size();
    if (n == 0) {
        throw DataError("statistics list no variables");
    }
    if (mean.size() != n || stddev.size() != n || stddev_diffs.size() != n) {
        throw DataError("statistics have inconsistent lengths");
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(mean[i]) || !std::isfinite(stddev[i]) ||
            !std::isfinite(stddev_diffs[i])) {
            throw DataError("non-finite statistic for variable " + variables[i]);
        }
        if (stddev[i] < 0.0 || stddev_diffs[i] < 0.0) {
            throw DataError("negative standard deviation for variable " + variables[i]);
        }
    }

    const size_t f = forcing_variables.size();
    if (forcing_mean.size() != f || forcing_stddev.size() != f) {
        throw DataError("forcing statistics have inconsistent lengths");
    }
    for (size_t i = 0; i < f; ++i) {
        if (!std::isfinite(forcing_mean[i]) || !std::isfinite(forcing_stddev[i]) ||
            forcing_stddev[i] < 0.0) {
            throw DataError("invalid forcing statistic for " + forcing_variables[i]);
        }
    }
}

// =============================================================================
// StatisticsIO
// =============================================================================

StatisticsIO::Table StatisticsIO::readTable(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataError("cannot open statistics file: " + path);
    }

    Table table;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream ss(line);
        std::string name, value_str, extra;
        if (!(ss >> name >> value_str) || (ss >> extra)) {
            throw DataError(path + ":" + std::to_string(line_num) +
                            ": expected 'name value', got '" + line + "'");
        }

        char* end = nullptr;
        double value = std::strtod(value_str.c_str(), &end);
        if (end == value_str.c_str() || *end != '\0') {
            throw DataError(path + ":" + std::to_string(line_num) +
                            ": cannot parse '" + value_str + "' as a number");
        }
        if (!std::isfinite(value)) {
            throw DataError(path + ":" + std::to_string(line_num) +
                            ": non-finite value for " + name);
        }
        table.emplace_back(name, value);
    }

    if (table.empty()) {
        throw DataError("statistics file lists no variables: " + path);
    }
    return table;
}

void StatisticsIO::writeTable(const std::string& path, const Table& table) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw DataError("cannot write statistics file: " + path);
    }
    file << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& row : table) {
        file << row.first << " " << row.second << "\n";
    }
    if (!file) {
        throw DataError("failed writing statistics file: " + path);
    }
}

std::shared_ptr<const Statistics> StatisticsIO::load(const std::string& mean_path,
                                                     const std::string& stddev_path,
                                                     const std::string& diffs_path) {
    return load(mean_path, stddev_path, diffs_path, "", "");
}

std::shared_ptr<const Statistics> StatisticsIO::load(const std::string& mean_path,
                                                     const std::string& stddev_path,
                                                     const std::string& diffs_path,
                                                     const std::string& forcing_mean_path,
                                                     const std::string& forcing_stddev_path) {
    Table mean = readTable(mean_path);
    Table stddev = readTable(stddev_path);
    Table diffs = readTable(diffs_path);

    requireSameVariables(mean, stddev, mean_path, stddev_path);
    requireSameVariables(mean, diffs, mean_path, diffs_path);

    auto stats = std::make_shared<Statistics>();
    stats->variables = namesOf(mean);
    stats->mean = valuesOf(mean);
    stats->stddev = valuesOf(stddev);
    stats->stddev_diffs = valuesOf(diffs);

    if (forcing_mean_path.empty() != forcing_stddev_path.empty()) {
        throw DataError("forcing statistics need both a mean and a stddev file");
    }
    if (!forcing_mean_path.empty()) {
        Table fmean = readTable(forcing_mean_path);
        Table fstd = readTable(forcing_stddev_path);
        requireSameVariables(fmean, fstd, forcing_mean_path, forcing_stddev_path);
        stats->forcing_variables = namesOf(fmean);
        stats->forcing_mean = valuesOf(fmean);
        stats->forcing_stddev = valuesOf(fstd);
    }

    stats->validate();
    return stats;
}

// =============================================================================
// FeatureNormalizer
// =============================================================================

FeatureNormalizer::FeatureNormalizer(std::shared_ptr<const Statistics> stats, double eps)
    : stats_(std::move(stats)), eps_(eps) {
    if (!stats_) {
        throw DataError("normalizer constructed without statistics");
    }
    if (!(eps_ > 0.0)) {
        throw ConfigurationError("stddev epsilon must be > 0");
    }
    stats_->validate();
}

ML::Tensor FeatureNormalizer::normalize(const ML::Tensor& raw) const {
    requireLastAxis(raw, stats_->numVariables(), "normalize");
    return affine(raw, stats_->mean, stats_->stddev, eps_, false);
}

ML::Tensor FeatureNormalizer::denormalize(const ML::Tensor& x) const {
    requireLastAxis(x, stats_->numVariables(), "denormalize");
    return affine(x, stats_->mean, stats_->stddev, eps_, true);
}

ML::Tensor FeatureNormalizer::denormalizeIncrement(const ML::Tensor& pred) const {
    requireLastAxis(pred, stats_->numVariables(), "denormalizeIncrement");
    return affine(pred, {}, stats_->stddev_diffs, eps_, true);
}

ML::Tensor FeatureNormalizer::normalizeForcings(const ML::Tensor& raw) const {
    if (stats_->numForcings() == 0) {
        return raw;
    }
    requireLastAxis(raw, stats_->numForcings(), "normalizeForcings");
    return affine(raw, stats_->forcing_mean, stats_->forcing_stddev, eps_, false);
}

} // namespace MMWF
