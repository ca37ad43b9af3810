// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <blas.hh>
#include <complex>
#include <cstdint>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/utils/logger.hpp>
#include <flowcore/utils/omp_utils.hpp>

#include "shape_checks.hpp"

namespace flowcore::algorithms::kernels {

template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> tensor_commutator(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b,
    int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  const std::size_t n = a.dimension();
  detail::require_same_dimension(n, detail::square_dimension(b, "matrix"));

  data::InteractionTensor<Scalar> c(n);
  const Scalar* A = a.data().data();
  Scalar* C = c.data().data();
  const long long m = static_cast<long long>(n);
  const long long m2 = m * m;
  const long long m3 = m2 * m;

  const int nthreads = utils::resolve_num_threads(num_threads);
#pragma omp parallel for collapse(4) num_threads(nthreads)
  for (long long i = 0; i < m; ++i) {
    for (long long j = 0; j < m; ++j) {
      for (long long k = 0; k < m; ++k) {
        for (long long q = 0; q < m; ++q) {
          Scalar sum(0.0);
          for (long long l = 0; l < m; ++l) {
            sum += A[i * m3 + j * m2 + k * m + l] * b(l, q);
            sum -= A[i * m3 + j * m2 + l * m + q] * b(k, l);
            sum += A[i * m3 + l * m2 + k * m + q] * b(l, j);
            sum -= A[l * m3 + j * m2 + k * m + q] * b(i, l);
          }
          C[i * m3 + j * m2 + k * m + q] = sum;
        }
      }
    }
  }
  return c;
}

template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> tensor_commutator_reference(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b) {
  FLOWCORE_LOG_TRACE_ENTERING();
  const std::size_t n = a.dimension();
  detail::require_same_dimension(n, detail::square_dimension(b, "matrix"));

  data::InteractionTensor<Scalar> c(n);
  if (n == 0) {
    return c;
  }

  const int64_t n1 = static_cast<int64_t>(n);
  const int64_t n2 = n1 * n1;
  const int64_t n3 = n2 * n1;
  const Scalar one(1.0);
  const Scalar minus_one(-1.0);
  const Scalar* A = a.data().data();
  const Scalar* B = b.data();
  Scalar* C = c.data().data();

  // The tensors are row-major while B is column-major: read in row-major
  // order, B.data() holds B^T.

  // C(ijk,q) += A(ijk,l) * B(l,q)
  blas::gemm(blas::Layout::RowMajor, blas::Op::NoTrans, blas::Op::Trans, n3,
             n1, n1, one, A, n1, B, n1, one, C, n1);

  // C(i,jkq) -= B(i,l) * A(l,jkq)
  blas::gemm(blas::Layout::RowMajor, blas::Op::Trans, blas::Op::NoTrans, n1,
             n3, n1, minus_one, B, n1, A, n3, one, C, n3);

  for (int64_t i = 0; i < n1; ++i) {
    // C_i(j,kq) += B^T(j,l) * A_i(l,kq)
    const Scalar* A_i = A + i * n3;
    Scalar* C_i = C + i * n3;
    blas::gemm(blas::Layout::RowMajor, blas::Op::NoTrans, blas::Op::NoTrans,
               n1, n2, n1, one, B, n1, A_i, n2, one, C_i, n2);

    // C_ij(k,q) -= B(k,l) * A_ij(l,q)
    for (int64_t j = 0; j < n1; ++j) {
      blas::gemm(blas::Layout::RowMajor, blas::Op::Trans, blas::Op::NoTrans,
                 n1, n1, n1, minus_one, B, n1, A_i + j * n2, n1, one,
                 C_i + j * n2, n1);
    }
  }
  return c;
}

template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> matrix_tensor_commutator(
    const data::Matrix<Scalar>& a, const data::InteractionTensor<Scalar>& b,
    int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  return -tensor_commutator(b, a, num_threads);
}

template data::InteractionTensor<double> tensor_commutator<double>(
    const data::InteractionTensor<double>&, const data::Matrix<double>&, int);
template data::InteractionTensor<std::complex<double>>
tensor_commutator<std::complex<double>>(
    const data::InteractionTensor<std::complex<double>>&,
    const data::Matrix<std::complex<double>>&, int);

template data::InteractionTensor<double> tensor_commutator_reference<double>(
    const data::InteractionTensor<double>&, const data::Matrix<double>&);
template data::InteractionTensor<std::complex<double>>
tensor_commutator_reference<std::complex<double>>(
    const data::InteractionTensor<std::complex<double>>&,
    const data::Matrix<std::complex<double>>&);

template data::InteractionTensor<double> matrix_tensor_commutator<double>(
    const data::Matrix<double>&, const data::InteractionTensor<double>&, int);
template data::InteractionTensor<std::complex<double>>
matrix_tensor_commutator<std::complex<double>>(
    const data::Matrix<std::complex<double>>&,
    const data::InteractionTensor<std::complex<double>>&, int);

}  // namespace flowcore::algorithms::kernels
