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

template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> normal_order_four_body(
    const data::InteractionTensor<Scalar>& a,
    const data::InteractionTensor<Scalar>& b,
    const data::ReferenceState& state, NormalOrderChannel channels,
    int num_threads) {
  FLOWCORE_LOG_TRACE_ENTERING();
  const std::size_t n = a.dimension();
  detail::require_same_dimension(n, b.dimension());
  detail::require_state_dimension(state, n);

  data::InteractionTensor<Scalar> c(n);
  const bool density = has_channel(channels, NormalOrderChannel::Density);
  const bool pairing = has_channel(channels, NormalOrderChannel::Pairing);
  if (!density && !pairing) {
    return c;
  }

  std::vector<double> occ(state.occupations().begin(),
                          state.occupations().end());
  const long long m = static_cast<long long>(n);

  const int nthreads = utils::resolve_num_threads(num_threads);
#pragma omp parallel for collapse(4) num_threads(nthreads)
  for (long long i = 0; i < m; ++i) {
    for (long long j = 0; j < m; ++j) {
      for (long long k = 0; k < m; ++k) {
        for (long long q = 0; q < m; ++q) {
          Scalar sum(0.0);
          for (long long l = 0; l < m; ++l) {
            for (long long p = 0; p < m; ++p) {
              if (density && occ[l] != occ[p]) {
                const Scalar direct =
                    b(p, l, k, q) + b(k, q, p, l) - b(p, q, k, l) +
                    b(k, l, p, q);
                const Scalar exchange =
                    b(p, l, k, q) + b(k, l, p, q) - b(p, q, k, l) +
                    b(k, q, p, l);
                const Scalar crossed =
                    b(k, p, l, q) + b(k, q, l, p) + b(l, p, k, q) -
                    b(l, q, k, p);
                sum += (occ[l] - occ[p]) *
                       ((a(i, j, l, p) + a(l, p, i, j)) * direct -
                        a(l, j, i, p) * exchange + a(i, l, p, j) * crossed);
              }
              if (pairing) {
                sum += (occ[l] + occ[p]) *
                       (a(l, j, p, q) * (b(i, p, k, l) + b(i, l, k, p)) +
                        a(i, l, k, p) * (b(p, j, l, q) + b(l, j, p, q)));
              }
            }
          }
          c(i, j, k, q) = sum;
        }
      }
    }
  }
  return c;
}

template data::InteractionTensor<double> normal_order_four_body<double>(
    const data::InteractionTensor<double>&,
    const data::InteractionTensor<double>&, const data::ReferenceState&,
    NormalOrderChannel, int);
template data::InteractionTensor<std::complex<double>>
normal_order_four_body<std::complex<double>>(
    const data::InteractionTensor<std::complex<double>>&,
    const data::InteractionTensor<std::complex<double>>&,
    const data::ReferenceState&, NormalOrderChannel, int);

}  // namespace flowcore::algorithms::kernels
