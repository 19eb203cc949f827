/**
 * @file PetscTensorIO.cpp
 * @brief Tensor <-> Vec conversion and PETSc binary tensor files
 */

#include "PetscTensorIO.hpp"
#include <cmath>
#include <limits>

namespace MMWF {

PetscErrorCode PetscTensorIO::tensorToVec(MPI_Comm comm, const ML::Tensor& tensor, Vec* vec) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    const PetscInt n = static_cast<PetscInt>(tensor.size());
    ierr = VecCreate(comm, vec); CHKERRQ(ierr);
    ierr = VecSetSizes(*vec, PETSC_DECIDE, n); CHKERRQ(ierr);
    ierr = VecSetFromOptions(*vec); CHKERRQ(ierr);

    // Every rank holds the full tensor, so each fills its own range
    PetscInt lo, hi;
    ierr = VecGetOwnershipRange(*vec, &lo, &hi); CHKERRQ(ierr);

    PetscScalar* array;
    ierr = VecGetArray(*vec, &array); CHKERRQ(ierr);
    for (PetscInt i = lo; i < hi; ++i) {
        array[i - lo] = tensor.data[i];
    }
    ierr = VecRestoreArray(*vec, &array); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode PetscTensorIO::vecToTensor(Vec vec, const std::vector<int>& shape,
                                          ML::Tensor& tensor) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscInt n;
    ierr = VecGetSize(vec, &n); CHKERRQ(ierr);

    size_t expected = 1;
    for (int s : shape) expected *= static_cast<size_t>(s);
    if (expected != static_cast<size_t>(n)) {
        SETERRQ(PetscObjectComm((PetscObject)vec), PETSC_ERR_ARG_SIZ,
                "Vec size does not match the requested tensor shape");
    }

    // Gather the whole vector on every rank
    VecScatter scatter;
    Vec all;
    ierr = VecScatterCreateToAll(vec, &scatter, &all); CHKERRQ(ierr);
    ierr = VecScatterBegin(scatter, vec, all, INSERT_VALUES, SCATTER_FORWARD); CHKERRQ(ierr);
    ierr = VecScatterEnd(scatter, vec, all, INSERT_VALUES, SCATTER_FORWARD); CHKERRQ(ierr);

    tensor = ML::Tensor(shape);
    const PetscScalar* array;
    ierr = VecGetArrayRead(all, &array); CHKERRQ(ierr);
    for (PetscInt i = 0; i < n; ++i) {
        tensor.data[i] = PetscRealPart(array[i]);
    }
    ierr = VecRestoreArrayRead(all, &array); CHKERRQ(ierr);

    ierr = VecScatterDestroy(&scatter); CHKERRQ(ierr);
    ierr = VecDestroy(&all); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode PetscTensorIO::writeTensor(MPI_Comm comm, const ML::Tensor& tensor,
                                          const std::string& path) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ML::Tensor header({tensor.dim() + 1});
    header.data[0] = tensor.dim();
    for (int d = 0; d < tensor.dim(); ++d) {
        header.data[d + 1] = tensor.shape[d];
    }

    PetscViewer viewer;
    ierr = PetscViewerBinaryOpen(comm, path.c_str(), FILE_MODE_WRITE, &viewer); CHKERRQ(ierr);

    Vec header_vec, data_vec;
    ierr = tensorToVec(comm, header, &header_vec); CHKERRQ(ierr);
    ierr = tensorToVec(comm, tensor, &data_vec); CHKERRQ(ierr);
    ierr = VecView(header_vec, viewer); CHKERRQ(ierr);
    ierr = VecView(data_vec, viewer); CHKERRQ(ierr);

    ierr = VecDestroy(&header_vec); CHKERRQ(ierr);
    ierr = VecDestroy(&data_vec); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode PetscTensorIO::readTensor(MPI_Comm comm, const std::string& path,
                                         ML::Tensor& tensor) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscViewer viewer;
    ierr = PetscViewerBinaryOpen(comm, path.c_str(), FILE_MODE_READ, &viewer); CHKERRQ(ierr);

    Vec header_vec;
    ierr = VecCreate(comm, &header_vec); CHKERRQ(ierr);
    ierr = VecLoad(header_vec, viewer); CHKERRQ(ierr);

    PetscInt header_size;
    ierr = VecGetSize(header_vec, &header_size); CHKERRQ(ierr);

    ML::Tensor header;
    ierr = vecToTensor(header_vec, {static_cast<int>(header_size)}, header); CHKERRQ(ierr);
    ierr = VecDestroy(&header_vec); CHKERRQ(ierr);

    if (header_size < 1 || header.data[0] != header_size - 1) {
        ierr = PetscViewerDestroy(&viewer); CHKERRQ(ierr);
        SETERRQ(comm, PETSC_ERR_FILE_UNEXPECTED, "Corrupt tensor header in %s", path.c_str());
    }
    std::vector<int> shape;
    for (PetscInt d = 1; d < header_size; ++d) {
        double s = header.data[d];
        if (!(s >= 0.0) || s != std::floor(s) ||
            s > static_cast<double>(std::numeric_limits<int>::max())) {
            ierr = PetscViewerDestroy(&viewer); CHKERRQ(ierr);
            SETERRQ(comm, PETSC_ERR_FILE_UNEXPECTED, "Invalid dimension in %s", path.c_str());
        }
        shape.push_back(static_cast<int>(s));
    }

    Vec data_vec;
    ierr = VecCreate(comm, &data_vec); CHKERRQ(ierr);
    ierr = VecLoad(data_vec, viewer); CHKERRQ(ierr);
    ierr = PetscViewerDestroy(&viewer); CHKERRQ(ierr);
    PetscErrorCode load_err = vecToTensor(data_vec, shape, tensor);
    ierr = VecDestroy(&data_vec); CHKERRQ(ierr);
    CHKERRQ(load_err);

    PetscFunctionReturn(0);
}

} // namespace MMWF
