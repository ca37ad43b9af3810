// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <complex>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/utils/logger.hpp>
#include <flowcore/utils/omp_utils.hpp>
#include <vector>

#include "shape_checks.hpp"

namespace flowcore::algorithms::kernels {

namespace {

/// A mode pair (k,q) with unequal occupation and its weight n_k - n_q
struct ContractedPair {
  long long k;
  long long q;
  double weight;
};

std::vector<ContractedPair> unblocked_pairs(const data::ReferenceState& state) {
  std::vector<ContractedPair> pairs;
  const auto& occ = state.occupations();
  const long long n = static_cast<long long>(occ.size());
  for (long long k = 0; k < n; ++k) {
    for (long long q = 0; q < n; ++q) {
      if (occ[k] != occ[q]) {
        pairs.push_back({k, q, static_cast<double>(occ[k] - occ[q])});
      }
    }
  }
  return pairs;
}

}  // namespace

template <data::ScalarField Scalar>
data::Matrix<Scalar> normal_order_two_body(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b,
    const data::ReferenceState& state, int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  const std::size_t n = a.dimension();
  detail::require_same_dimension(n, detail::square_dimension(b, "matrix"));
  detail::require_state_dimension(state, n);

  const long long m = static_cast<long long>(n);
  data::Matrix<Scalar> c = data::Matrix<Scalar>::Zero(m, m);
  const std::vector<ContractedPair> pairs = unblocked_pairs(state);
  if (pairs.empty()) {
    return c;
  }

  const long long num_pairs = static_cast<long long>(pairs.size());
  const int nthreads = utils::resolve_num_threads(num_threads);
#pragma omp parallel for collapse(2) num_threads(nthreads)
  for (long long i = 0; i < m; ++i) {
    for (long long j = 0; j < m; ++j) {
      Scalar sum(0.0);
      for (long long p = 0; p < num_pairs; ++p) {
        const long long k = pairs[p].k;
        const long long q = pairs[p].q;
        sum += pairs[p].weight * b(q, k) *
               (a(i, j, k, q) + a(k, q, i, j) - a(k, j, i, q) + a(i, q, k, j));
      }
      c(i, j) = sum;
    }
  }
  return c;
}

template <data::ScalarField Scalar>
data::Matrix<Scalar> normal_order_two_body_mirror(
    const data::Matrix<Scalar>& a, const data::InteractionTensor<Scalar>& b,
    const data::ReferenceState& state, int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  return -normal_order_two_body(b, a, state, num_threads);
}

template data::Matrix<double> normal_order_two_body<double>(
    const data::InteractionTensor<double>&, const data::Matrix<double>&,
    const data::ReferenceState&, int);
template data::Matrix<std::complex<double>>
normal_order_two_body<std::complex<double>>(
    const data::InteractionTensor<std::complex<double>>&,
    const data::Matrix<std::complex<double>>&, const data::ReferenceState&,
    int);

template data::Matrix<double> normal_order_two_body_mirror<double>(
    const data::Matrix<double>&, const data::InteractionTensor<double>&,
    const data::ReferenceState&, int);
template data::Matrix<std::complex<double>>
normal_order_two_body_mirror<std::complex<double>>(
    const data::Matrix<std::complex<double>>&,
    const data::InteractionTensor<std::complex<double>>&,
    const data::ReferenceState&, int);

}  // namespace flowcore::algorithms::kernels
