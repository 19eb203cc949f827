/**
 * @file test_feature_normalizer.cpp
 * @brief Unit tests for statistics files and feature normalisation
 */

#include <gtest/gtest.h>
#include "FeatureNormalizer.hpp"
#include "ForecastErrors.hpp"
#include <petsc.h>
#include <cmath>
#include <cstdio>
#include <fstream>

using namespace MMWF;

class FeatureNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

        if (rank == 0) {
            writeFile(mean_file, "# per-variable means\n"
                                 "temperature 280.0\n"
                                 "\n"
                                 "pressure 1000.0\n"
                                 "humidity 0.01\n");
            writeFile(stddev_file, "temperature 20.0\n"
                                   "pressure 50.0\n"
                                   "humidity 0.0\n");
            writeFile(diffs_file, "temperature 2.0\n"
                                  "pressure 5.0\n"
                                  "humidity 0.001\n");
            writeFile(forcing_mean_file, "toa_radiation 340.0\n");
            writeFile(forcing_stddev_file, "toa_radiation 100.0\n");
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            for (const char* f : {mean_file, stddev_file, diffs_file, forcing_mean_file,
                                  forcing_stddev_file, scratch_file}) {
                std::remove(f);
            }
        }
    }

    static void writeFile(const char* path, const char* text) {
        std::ofstream out(path);
        out << text;
    }

    const char* mean_file = "test_stats_mean.txt";
    const char* stddev_file = "test_stats_stddev.txt";
    const char* diffs_file = "test_stats_diffs.txt";
    const char* forcing_mean_file = "test_stats_forcing_mean.txt";
    const char* forcing_stddev_file = "test_stats_forcing_stddev.txt";
    const char* scratch_file = "test_stats_scratch.txt";
    int rank;
};

TEST_F(FeatureNormalizerTest, ReadTableSkipsCommentsAndBlanks) {
    auto table = StatisticsIO::readTable(mean_file);
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table[0].first, "temperature");
    EXPECT_DOUBLE_EQ(table[1].second, 1000.0);
    EXPECT_EQ(table[2].first, "humidity");
}

TEST_F(FeatureNormalizerTest, LoadStatistics) {
    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    ASSERT_EQ(stats->numVariables(), 3);
    EXPECT_EQ(stats->numForcings(), 0);
    EXPECT_DOUBLE_EQ(stats->stddev[1], 50.0);
    EXPECT_DOUBLE_EQ(stats->stddev_diffs[2], 0.001);

    auto with_forcings = StatisticsIO::load(mean_file, stddev_file, diffs_file,
                                            forcing_mean_file, forcing_stddev_file);
    EXPECT_EQ(with_forcings->numForcings(), 1);
    EXPECT_EQ(with_forcings->forcing_variables[0], "toa_radiation");
}

TEST_F(FeatureNormalizerTest, MissingFileIsDataError) {
    EXPECT_THROW(StatisticsIO::load("no_such_mean.txt", stddev_file, diffs_file), DataError);
    EXPECT_THROW(StatisticsIO::load(mean_file, stddev_file, diffs_file, forcing_mean_file, ""),
                 DataError);
}

TEST_F(FeatureNormalizerTest, MalformedFileIsDataError) {
    if (rank == 0) writeFile(scratch_file, "temperature warm\n");
    MPI_Barrier(PETSC_COMM_WORLD);
    EXPECT_THROW(StatisticsIO::readTable(scratch_file), DataError);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) writeFile(scratch_file, "temperature 1.0 2.0\n");
    MPI_Barrier(PETSC_COMM_WORLD);
    EXPECT_THROW(StatisticsIO::readTable(scratch_file), DataError);
}

TEST_F(FeatureNormalizerTest, MismatchedVariablesAreDataError) {
    if (rank == 0) {
        writeFile(scratch_file, "temperature 20.0\n"
                                "humidity 0.1\n"
                                "pressure 50.0\n");
    }
    MPI_Barrier(PETSC_COMM_WORLD);
    EXPECT_THROW(StatisticsIO::load(mean_file, scratch_file, diffs_file), DataError);
}

TEST_F(FeatureNormalizerTest, WriteTableRoundTrip) {
    StatisticsIO::Table table = {{"u", 0.1}, {"v", -1.0 / 3.0}};
    if (rank == 0) StatisticsIO::writeTable(scratch_file, table);
    MPI_Barrier(PETSC_COMM_WORLD);

    auto loaded = StatisticsIO::readTable(scratch_file);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[1].first, "v");
    EXPECT_DOUBLE_EQ(loaded[1].second, -1.0 / 3.0);
}

TEST_F(FeatureNormalizerTest, NormalizeAndDenormalize) {
    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    FeatureNormalizer normalizer(stats);

    ML::Tensor raw({2, 3}, std::vector<double>{300.0, 950.0, 0.01,
                                               260.0, 1100.0, 0.02});
    ML::Tensor x = normalizer.normalize(raw);
    EXPECT_DOUBLE_EQ(x(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(x(0, 1), -1.0);
    EXPECT_DOUBLE_EQ(x(1, 1), 2.0);

    ML::Tensor back = normalizer.denormalize(x);
    EXPECT_LT(back.maxAbsDiff(raw), 1e-9);
}

TEST_F(FeatureNormalizerTest, ZeroStddevUsesEpsilonFloor) {
    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    FeatureNormalizer normalizer(stats, 1e-6);
    EXPECT_DOUBLE_EQ(normalizer.epsilon(), 1e-6);

    ML::Tensor raw({1, 3}, std::vector<double>{280.0, 1000.0, 0.01 + 1e-6});
    ML::Tensor x = normalizer.normalize(raw);
    EXPECT_TRUE(x.allFinite());
    EXPECT_NEAR(x(0, 2), 1.0, 1e-6);

    EXPECT_THROW(FeatureNormalizer(stats, 0.0), ConfigurationError);
}

TEST_F(FeatureNormalizerTest, IncrementUsesDifferenceStddev) {
    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    FeatureNormalizer normalizer(stats);

    ML::Tensor pred({1, 3}, std::vector<double>{1.0, -2.0, 0.5});
    ML::Tensor inc = normalizer.denormalizeIncrement(pred);
    EXPECT_DOUBLE_EQ(inc(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(inc(0, 1), -10.0);
    EXPECT_DOUBLE_EQ(inc(0, 2), 0.0005);
}

TEST_F(FeatureNormalizerTest, ForcingNormalization) {
    auto plain = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    FeatureNormalizer identity(plain);
    ML::Tensor forcings({2, 4}, 7.0);
    EXPECT_DOUBLE_EQ(identity.normalizeForcings(forcings).maxAbsDiff(forcings), 0.0);

    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file,
                                    forcing_mean_file, forcing_stddev_file);
    FeatureNormalizer normalizer(stats);
    ML::Tensor toa({2, 1}, std::vector<double>{440.0, 240.0});
    ML::Tensor f = normalizer.normalizeForcings(toa);
    EXPECT_DOUBLE_EQ(f(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(f(1, 0), -1.0);

    EXPECT_THROW(normalizer.normalizeForcings(forcings), DataError);
}

TEST_F(FeatureNormalizerTest, WrongVariableCountIsDataError) {
    auto stats = StatisticsIO::load(mean_file, stddev_file, diffs_file);
    FeatureNormalizer normalizer(stats);
    EXPECT_THROW(normalizer.normalize(ML::Tensor({4, 2})), DataError);
    EXPECT_THROW(normalizer.denormalizeIncrement(ML::Tensor({4, 5})), DataError);
}

TEST_F(FeatureNormalizerTest, InvalidStatisticsRejected) {
    auto stats = std::make_shared<Statistics>();
    stats->variables = {"t"};
    stats->mean = {1.0};
    stats->stddev = {-1.0};
    stats->stddev_diffs = {1.0};
    EXPECT_THROW(stats->validate(), DataError);
    EXPECT_THROW(FeatureNormalizer normalizer(stats), DataError);
}
