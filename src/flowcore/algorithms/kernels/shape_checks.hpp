// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Core>
#include <cstddef>
#include <flowcore/data/reference_state.hpp>
#include <flowcore/data/tensor.hpp>
#include <string>

namespace flowcore::algorithms::kernels::detail {

/**
 * @brief Dimension of a square matrix
 * @throws data::ShapeMismatch if the matrix is not square
 */
template <typename Derived>
std::size_t square_dimension(const Eigen::MatrixBase<Derived>& m,
                             const char* what) {
  if (m.rows() != m.cols()) {
    throw data::ShapeMismatch(std::string(what) + " is " +
                              std::to_string(m.rows()) + "x" +
                              std::to_string(m.cols()) + ", expected square");
  }
  return static_cast<std::size_t>(m.rows());
}

inline void require_same_dimension(std::size_t lhs, std::size_t rhs) {
  if (lhs != rhs) {
    throw data::ShapeMismatch("operands of dimension " + std::to_string(lhs) +
                              " and " + std::to_string(rhs));
  }
}

inline void require_state_dimension(const data::ReferenceState& state,
                                    std::size_t n) {
  if (state.size() != n) {
    throw data::ShapeMismatch("reference state with " +
                              std::to_string(state.size()) +
                              " modes for operands of dimension " +
                              std::to_string(n));
  }
}

}  // namespace flowcore::algorithms::kernels::detail
