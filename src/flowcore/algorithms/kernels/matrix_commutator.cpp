// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <complex>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/utils/logger.hpp>
#include <flowcore/utils/omp_utils.hpp>

#include "shape_checks.hpp"

namespace flowcore::algorithms::kernels {

namespace {

inline double conjugate(double x) { return x; }

inline std::complex<double> conjugate(const std::complex<double>& x) {
  return std::conj(x);
}

}  // namespace

template <data::ScalarField Scalar>
data::Matrix<Scalar> commutator(const data::Matrix<Scalar>& a,
                                const data::Matrix<Scalar>& b,
                                MirrorSymmetry symmetry, bool hermitian,
                                int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  const auto n = detail::square_dimension(a, "left matrix");
  detail::require_same_dimension(n,
                                 detail::square_dimension(b, "right matrix"));

  const Eigen::Index m = static_cast<Eigen::Index>(n);
  const Scalar sign =
      symmetry == MirrorSymmetry::Symmetric ? Scalar(1.0) : Scalar(-1.0);
  data::Matrix<Scalar> c = data::Matrix<Scalar>::Zero(m, m);

  const int nthreads = utils::resolve_num_threads(num_threads);
  // Rows of the upper triangle shrink with i
#pragma omp parallel for schedule(dynamic) num_threads(nthreads)
  for (Eigen::Index i = 0; i < m; ++i) {
    for (Eigen::Index j = i; j < m; ++j) {
      Scalar sum(0.0);
      for (Eigen::Index k = 0; k < m; ++k) {
        sum += a(i, k) * b(k, j) - b(i, k) * a(k, j);
      }
      c(i, j) = sum;
      if (j != i) {
        c(j, i) = sign * (hermitian ? conjugate(sum) : sum);
      }
    }
  }
  return c;
}

template <data::ScalarField Scalar>
data::Matrix<Scalar> commutator_reference(const data::Matrix<Scalar>& a,
                                          const data::Matrix<Scalar>& b) {
  FLOWCORE_LOG_TRACE_ENTERING();
  detail::require_same_dimension(detail::square_dimension(a, "left matrix"),
                                 detail::square_dimension(b, "right matrix"));
  data::Matrix<Scalar> c = a * b;
  c.noalias() -= b * a;
  return c;
}

template data::Matrix<double> commutator<double>(const data::Matrix<double>&,
                                                 const data::Matrix<double>&,
                                                 MirrorSymmetry, bool, int);
template data::Matrix<std::complex<double>> commutator<std::complex<double>>(
    const data::Matrix<std::complex<double>>&,
    const data::Matrix<std::complex<double>>&, MirrorSymmetry, bool, int);

template data::Matrix<double> commutator_reference<double>(
    const data::Matrix<double>&, const data::Matrix<double>&);
template data::Matrix<std::complex<double>>
commutator_reference<std::complex<double>>(
    const data::Matrix<std::complex<double>>&,
    const data::Matrix<std::complex<double>>&);

}  // namespace flowcore::algorithms::kernels
