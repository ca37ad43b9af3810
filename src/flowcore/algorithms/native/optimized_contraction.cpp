// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "optimized_contraction.hpp"

namespace flowcore::algorithms::native {

data::Matrix<double> SymmetryOptimizedContraction::_commutator(
    const data::Matrix<double>& a, const data::Matrix<double>& b,
    const ContractionOptions& options) const {
  return kernels::commutator(a, b, options.symmetry, options.hermitian,
                             num_threads());
}

data::Matrix<std::complex<double>> SymmetryOptimizedContraction::_commutator(
    const data::Matrix<std::complex<double>>& a,
    const data::Matrix<std::complex<double>>& b,
    const ContractionOptions& options) const {
  return kernels::commutator(a, b, options.symmetry, options.hermitian,
                             num_threads());
}

data::InteractionTensor<double>
SymmetryOptimizedContraction::_tensor_commutator(
    const data::InteractionTensor<double>& a,
    const data::Matrix<double>& b) const {
  return kernels::tensor_commutator(a, b, num_threads());
}

data::InteractionTensor<std::complex<double>>
SymmetryOptimizedContraction::_tensor_commutator(
    const data::InteractionTensor<std::complex<double>>& a,
    const data::Matrix<std::complex<double>>& b) const {
  return kernels::tensor_commutator(a, b, num_threads());
}

}  // namespace flowcore::algorithms::native
