// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <complex>
#include <cstddef>
#include <flowcore/data/tensor.hpp>
#include <string>
#include <variant>

namespace flowcore::data {

/**
 * @class Operand
 * @brief A rank-2 or rank-4 operand over a real or complex scalar field
 *
 * Owns exactly one of a real matrix, a complex matrix, a real tensor or a
 * complex tensor. This is the value consumed and produced by the contraction
 * engine.
 */
class Operand {
 public:
  using value_type =
      std::variant<Eigen::MatrixXd, Eigen::MatrixXcd, InteractionTensor<double>,
                   InteractionTensor<std::complex<double>>>;

  /**
   * @brief Wrap a matrix
   * @throws ShapeMismatch if the matrix is not square
   */
  Operand(Eigen::MatrixXd m);
  Operand(Eigen::MatrixXcd m);

  Operand(InteractionTensor<double> t);
  Operand(InteractionTensor<std::complex<double>> t);

  /// 2 for a matrix, 4 for a tensor
  int rank() const;

  /// Extent N of every index
  std::size_t dimension() const;

  bool is_complex() const;

  /**
   * @brief Typed accessors
   * @throws std::bad_variant_access if the operand holds another kind
   */
  const Eigen::MatrixXd& real_matrix() const;
  const Eigen::MatrixXcd& complex_matrix() const;
  const InteractionTensor<double>& real_tensor() const;
  const InteractionTensor<std::complex<double>>& complex_tensor() const;

  /**
   * @brief Matrix over the given scalar field
   * @throws std::bad_variant_access if the operand holds another kind
   */
  template <ScalarField Scalar>
  const Matrix<Scalar>& matrix() const {
    return std::get<Matrix<Scalar>>(_value);
  }

  template <ScalarField Scalar>
  const InteractionTensor<Scalar>& tensor() const {
    return std::get<InteractionTensor<Scalar>>(_value);
  }

  /**
   * @brief Copy of the operand over the complex field
   */
  Operand to_complex() const;

  const value_type& value() const { return _value; }

  /// Short description, e.g. "complex rank-4 (N=6)"
  std::string describe() const;

 private:
  value_type _value;
};

}  // namespace flowcore::data
