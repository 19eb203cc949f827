/**
 * @file PetscTensorIO.hpp
 * @brief Exchange of tensors with PETSc vectors and binary files
 *
 * A tensor file written by writeTensor holds two Vecs in PETSc binary
 * format: a header [ndim, dim_0, ..., dim_{ndim-1}] followed by the
 * row-major data. Tensors are replicated on every rank; Vecs are
 * distributed with PETSC_DECIDE.
 */

#ifndef MMWF_PETSC_TENSOR_IO_HPP
#define MMWF_PETSC_TENSOR_IO_HPP

#include "Tensor.hpp"
#include <petsc.h>
#include <string>

namespace MMWF {

class PetscTensorIO {
public:
    /**
     * @brief Create a Vec on comm holding the tensor data (caller destroys it)
     */
    static PetscErrorCode tensorToVec(MPI_Comm comm, const ML::Tensor& tensor, Vec* vec);

    /**
     * @brief Copy a (possibly distributed) Vec into a replicated tensor
     *
     * `shape` must describe exactly the Vec's global size.
     */
    static PetscErrorCode vecToTensor(Vec vec, const std::vector<int>& shape,
                                      ML::Tensor& tensor);

    static PetscErrorCode writeTensor(MPI_Comm comm, const ML::Tensor& tensor,
                                      const std::string& path);

    static PetscErrorCode readTensor(MPI_Comm comm, const std::string& path,
                                     ML::Tensor& tensor);
};

} // namespace MMWF

#endif // MMWF_PETSC_TENSOR_IO_HPP
