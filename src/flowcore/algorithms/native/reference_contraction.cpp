// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "reference_contraction.hpp"

namespace flowcore::algorithms::native {

data::Matrix<double> ReferenceContraction::_commutator(
    const data::Matrix<double>& a, const data::Matrix<double>& b,
    const ContractionOptions& /*options*/) const {
  return kernels::commutator_reference(a, b);
}

data::Matrix<std::complex<double>> ReferenceContraction::_commutator(
    const data::Matrix<std::complex<double>>& a,
    const data::Matrix<std::complex<double>>& b,
    const ContractionOptions& /*options*/) const {
  return kernels::commutator_reference(a, b);
}

data::InteractionTensor<double> ReferenceContraction::_tensor_commutator(
    const data::InteractionTensor<double>& a,
    const data::Matrix<double>& b) const {
  return kernels::tensor_commutator_reference(a, b);
}

data::InteractionTensor<std::complex<double>>
ReferenceContraction::_tensor_commutator(
    const data::InteractionTensor<std::complex<double>>& a,
    const data::Matrix<std::complex<double>>& b) const {
  return kernels::tensor_commutator_reference(a, b);
}

}  // namespace flowcore::algorithms::native
