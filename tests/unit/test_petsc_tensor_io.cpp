/**
 * @file test_petsc_tensor_io.cpp
 * @brief Unit tests for tensor exchange with PETSc vectors and binary files
 */

#include <gtest/gtest.h>
#include "PetscTensorIO.hpp"
#include <petsc.h>
#include <cmath>
#include <cstdio>

using namespace MMWF;

class PetscTensorIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(tensor_file);
            std::remove((std::string(tensor_file) + ".info").c_str());
        }
    }

    static ML::Tensor ramp(const std::vector<int>& shape) {
        ML::Tensor t(shape);
        for (size_t i = 0; i < t.size(); ++i) t.data[i] = 0.5 * i - 3.0;
        return t;
    }

    const char* tensor_file = "test_tensor_io.bin";
    int rank;
};

TEST_F(PetscTensorIOTest, TensorToVecAndBack) {
    ML::Tensor t = ramp({3, 5});

    Vec v;
    PetscErrorCode ierr = PetscTensorIO::tensorToVec(PETSC_COMM_WORLD, t, &v);
    ASSERT_EQ(ierr, 0);

    PetscInt n;
    VecGetSize(v, &n);
    EXPECT_EQ(n, 15);

    PetscReal sum_abs;
    VecNorm(v, NORM_1, &sum_abs);
    double expected = 0.0;
    for (double x : t.data) expected += std::abs(x);
    EXPECT_NEAR(sum_abs, expected, 1e-12);

    ML::Tensor back;
    ierr = PetscTensorIO::vecToTensor(v, {5, 3}, back);
    ASSERT_EQ(ierr, 0);
    EXPECT_EQ(back.shape, (std::vector<int>{5, 3}));
    EXPECT_EQ(back.data, t.data);

    VecDestroy(&v);
}

TEST_F(PetscTensorIOTest, VecToTensorRejectsWrongShape) {
    Vec v;
    ASSERT_EQ(PetscTensorIO::tensorToVec(PETSC_COMM_WORLD, ramp({4}), &v), 0);

    PetscPushErrorHandler(PetscIgnoreErrorHandler, nullptr);
    ML::Tensor out;
    PetscErrorCode ierr = PetscTensorIO::vecToTensor(v, {2, 3}, out);
    PetscPopErrorHandler();

    EXPECT_NE(ierr, 0);
    VecDestroy(&v);
}

TEST_F(PetscTensorIOTest, WriteAndReadFile) {
    ML::Tensor t = ramp({2, 3, 4});
    ASSERT_EQ(PetscTensorIO::writeTensor(PETSC_COMM_WORLD, t, tensor_file), 0);

    ML::Tensor loaded;
    ASSERT_EQ(PetscTensorIO::readTensor(PETSC_COMM_WORLD, tensor_file, loaded), 0);
    EXPECT_EQ(loaded.shape, t.shape);
    EXPECT_DOUBLE_EQ(loaded.maxAbsDiff(t), 0.0);
}

TEST_F(PetscTensorIOTest, MissingFileFails) {
    PetscPushErrorHandler(PetscIgnoreErrorHandler, nullptr);
    ML::Tensor loaded;
    PetscErrorCode ierr = PetscTensorIO::readTensor(PETSC_COMM_WORLD, "no_such_tensor.bin",
                                                    loaded);
    PetscPopErrorHandler();
    EXPECT_NE(ierr, 0);
}

TEST_F(PetscTensorIOTest, InconsistentHeaderFails) {
    // Header claims three dimensions but lists only one
    Vec header, data;
    ASSERT_EQ(PetscTensorIO::tensorToVec(PETSC_COMM_WORLD,
                                         ML::Tensor({2}, std::vector<double>{3.0, 4.0}),
                                         &header), 0);
    ASSERT_EQ(PetscTensorIO::tensorToVec(PETSC_COMM_WORLD, ramp({4}), &data), 0);

    PetscViewer viewer;
    PetscViewerBinaryOpen(PETSC_COMM_WORLD, tensor_file, FILE_MODE_WRITE, &viewer);
    VecView(header, viewer);
    VecView(data, viewer);
    PetscViewerDestroy(&viewer);
    VecDestroy(&header);
    VecDestroy(&data);

    PetscPushErrorHandler(PetscIgnoreErrorHandler, nullptr);
    ML::Tensor loaded;
    PetscErrorCode ierr = PetscTensorIO::readTensor(PETSC_COMM_WORLD, tensor_file, loaded);
    PetscPopErrorHandler();
    EXPECT_NE(ierr, 0);
}

TEST_F(PetscTensorIOTest, OversizedDimensionFails) {
    // One dimension beyond the range of int
    Vec header, data;
    ASSERT_EQ(PetscTensorIO::tensorToVec(PETSC_COMM_WORLD,
                                         ML::Tensor({2}, std::vector<double>{1.0, 3.0e9}),
                                         &header), 0);
    ASSERT_EQ(PetscTensorIO::tensorToVec(PETSC_COMM_WORLD, ramp({4}), &data), 0);

    PetscViewer viewer;
    PetscViewerBinaryOpen(PETSC_COMM_WORLD, tensor_file, FILE_MODE_WRITE, &viewer);
    VecView(header, viewer);
    VecView(data, viewer);
    PetscViewerDestroy(&viewer);
    VecDestroy(&header);
    VecDestroy(&data);

    PetscPushErrorHandler(PetscIgnoreErrorHandler, nullptr);
    ML::Tensor loaded;
    PetscErrorCode ierr = PetscTensorIO::readTensor(PETSC_COMM_WORLD, tensor_file, loaded);
    PetscPopErrorHandler();
    EXPECT_NE(ierr, 0);

    // The file is still readable once the failed read has released it
    ML::Tensor t = ramp({2, 2});
    ASSERT_EQ(PetscTensorIO::writeTensor(PETSC_COMM_WORLD, t, tensor_file), 0);
    ASSERT_EQ(PetscTensorIO::readTensor(PETSC_COMM_WORLD, tensor_file, loaded), 0);
    EXPECT_EQ(loaded.shape, t.shape);
}
