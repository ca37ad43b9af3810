// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <flowcore/algorithms/contraction.hpp>

namespace flowcore::algorithms::native {

/**
 * @brief Contraction engine evaluating commutators as full dense products
 *
 * Ignores the declared symmetry of matrix commutators. Normal ordering is
 * delegated to the optimized kernels.
 */
class ReferenceContraction : public ContractionEngine {
 public:
  ReferenceContraction() {
    _settings = std::make_unique<ContractionSettings>();
  }
  ~ReferenceContraction() override = default;

  std::string name() const final {
    return to_string(ContractionVariant::Reference);
  }

  bool supports_normal_ordering() const final { return false; }

 protected:
  data::Matrix<double> _commutator(
      const data::Matrix<double>& a, const data::Matrix<double>& b,
      const ContractionOptions& options) const override;
  data::Matrix<std::complex<double>> _commutator(
      const data::Matrix<std::complex<double>>& a,
      const data::Matrix<std::complex<double>>& b,
      const ContractionOptions& options) const override;

  data::InteractionTensor<double> _tensor_commutator(
      const data::InteractionTensor<double>& a,
      const data::Matrix<double>& b) const override;
  data::InteractionTensor<std::complex<double>> _tensor_commutator(
      const data::InteractionTensor<std::complex<double>>& a,
      const data::Matrix<std::complex<double>>& b) const override;
};

}  // namespace flowcore::algorithms::native
