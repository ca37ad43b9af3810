// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <flowcore/data/reference_state.hpp>
#include <flowcore/data/tensor.hpp>
#include <string>

namespace testing {

/// @brief Tolerance for numerical zeros
inline static constexpr double numerical_zero_tolerance = 1e-12;

/// @brief Tolerance for two formulations of the same contraction
inline static constexpr double contraction_tolerance = 1e-10;

/// @brief Tolerance for JSON comparisons
inline static constexpr double json_tolerance = 1e-10;

using namespace flowcore::data;

using cplx = std::complex<double>;

/**
 * @brief Random real symmetric matrix
 */
inline Eigen::MatrixXd random_symmetric(Eigen::Index n) {
  Eigen::MatrixXd m = Eigen::MatrixXd::Random(n, n);
  return 0.5 * (m + m.transpose());
}

/**
 * @brief Random complex Hermitian matrix
 */
inline Eigen::MatrixXcd random_hermitian(Eigen::Index n) {
  Eigen::MatrixXcd m = Eigen::MatrixXcd::Random(n, n);
  return 0.5 * (m + m.adjoint());
}

/**
 * @brief Random complex anti-Hermitian matrix
 */
inline Eigen::MatrixXcd random_antihermitian(Eigen::Index n) {
  Eigen::MatrixXcd m = Eigen::MatrixXcd::Random(n, n);
  return 0.5 * (m - m.adjoint());
}

/**
 * @brief Largest absolute element-wise difference of two tensors
 */
template <ScalarField Scalar>
double max_abs_diff(const InteractionTensor<Scalar>& a,
                    const InteractionTensor<Scalar>& b) {
  return (a.data() - b.data()).cwiseAbs().maxCoeff();
}

/**
 * @brief Tensor commutator evaluated directly from its definition
 */
template <ScalarField Scalar>
InteractionTensor<Scalar> brute_force_tensor_commutator(
    const InteractionTensor<Scalar>& a, const Matrix<Scalar>& b) {
  const std::size_t n = a.dimension();
  InteractionTensor<Scalar> c(n);
  for (std::size_t i = 0; i < n; ++i)
    for (std::size_t j = 0; j < n; ++j)
      for (std::size_t k = 0; k < n; ++k)
        for (std::size_t q = 0; q < n; ++q)
          for (std::size_t l = 0; l < n; ++l)
            c(i, j, k, q) += a(i, j, k, l) * b(l, q) - a(i, j, l, q) * b(k, l) +
                             a(i, l, k, q) * b(l, j) - a(l, j, k, q) * b(i, l);
  return c;
}

/**
 * @brief Two-body normal-ordering correction evaluated over every mode pair
 */
template <ScalarField Scalar>
Matrix<Scalar> brute_force_two_body(const InteractionTensor<Scalar>& a,
                                    const Matrix<Scalar>& b,
                                    const ReferenceState& state) {
  const std::size_t n = a.dimension();
  Matrix<Scalar> c = Matrix<Scalar>::Zero(n, n);
  for (std::size_t i = 0; i < n; ++i)
    for (std::size_t j = 0; j < n; ++j)
      for (std::size_t k = 0; k < n; ++k)
        for (std::size_t q = 0; q < n; ++q) {
          const double w = state.occupation(k) - state.occupation(q);
          c(i, j) += w * b(q, k) *
                     (a(i, j, k, q) + a(k, q, i, j) - a(k, j, i, q) +
                      a(i, q, k, j));
        }
  return c;
}

/**
 * @brief Four-body normal-ordering correction evaluated term by term over
 * every internal pair
 */
template <ScalarField Scalar>
InteractionTensor<Scalar> brute_force_four_body(
    const InteractionTensor<Scalar>& a, const InteractionTensor<Scalar>& b,
    const ReferenceState& state, bool density, bool pairing) {
  const std::size_t n = a.dimension();
  InteractionTensor<Scalar> c(n);
  for (std::size_t i = 0; i < n; ++i)
    for (std::size_t j = 0; j < n; ++j)
      for (std::size_t k = 0; k < n; ++k)
        for (std::size_t q = 0; q < n; ++q)
          for (std::size_t l = 0; l < n; ++l)
            for (std::size_t m = 0; m < n; ++m) {
              const double nl = state.occupation(l);
              const double nm = state.occupation(m);
              if (density) {
                const double w = nl - nm;
                c(i, j, k, q) += w * a(i, j, l, m) *
                                 (b(m, l, k, q) + b(k, q, m, l) -
                                  b(m, q, k, l) + b(k, l, m, q));
                c(i, j, k, q) += w * a(l, m, i, j) *
                                 (b(m, l, k, q) + b(k, q, m, l) -
                                  b(m, q, k, l) + b(k, l, m, q));
                c(i, j, k, q) -= w * a(l, j, i, m) *
                                 (b(m, l, k, q) + b(k, l, m, q) -
                                  b(m, q, k, l) + b(k, q, m, l));
                c(i, j, k, q) += w * a(i, l, m, j) *
                                 (b(k, m, l, q) + b(k, q, l, m) +
                                  b(l, m, k, q) - b(l, q, k, m));
              }
              if (pairing) {
                const double w = nl + nm;
                c(i, j, k, q) +=
                    w * a(l, j, m, q) * (b(i, m, k, l) + b(i, l, k, m));
                c(i, j, k, q) +=
                    w * a(i, l, k, m) * (b(m, j, l, q) + b(l, j, m, q));
              }
            }
  return c;
}

}  // namespace testing
