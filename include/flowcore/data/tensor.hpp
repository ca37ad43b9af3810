// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace flowcore::data {

/**
 * @brief Element types supported by the contraction kernels
 */
template <typename T>
concept ScalarField =
    std::same_as<T, double> || std::same_as<T, std::complex<double>>;

/**
 * @brief Common element type of two scalar fields (complex wins)
 */
template <ScalarField A, ScalarField B>
using promote_t =
    std::conditional_t<std::is_same_v<A, double> && std::is_same_v<B, double>,
                       double, std::complex<double>>;

/**
 * @brief Dense square matrix over a scalar field
 */
template <ScalarField Scalar>
using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * @brief Exception thrown when operand dimensions do not agree
 *
 * Raised for non-square matrices, flat tensor storage whose length is not
 * N^4, operands of different N, and reference states of the wrong length.
 */
class ShapeMismatch : public std::invalid_argument {
 public:
  explicit ShapeMismatch(const std::string& what)
      : std::invalid_argument("Shape mismatch: " + what) {}
};

/**
 * @brief Dense rank-4 tensor with N entries along every index
 *
 * Elements are stored in one contiguous column vector in row-major index
 * order, element (i,j,k,l) at offset ((i*N + j)*N + k)*N + l. The storage
 * can be viewed as a row-major (N^2 x N^2) or (N^3 x N) matrix without
 * copying.
 *
 * @tparam Scalar double or std::complex<double>
 */
template <ScalarField Scalar>
class InteractionTensor {
 public:
  using scalar_type = Scalar;
  using storage_type = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

  /**
   * @brief Construct an empty tensor with N = 0
   */
  InteractionTensor() = default;

  /**
   * @brief Construct a zero-initialized tensor
   * @param n Extent of every index
   */
  explicit InteractionTensor(std::size_t n)
      : _n(n), _data(storage_type::Zero(n * n * n * n)) {}

  /**
   * @brief Adopt flat row-major storage
   * @param n Extent of every index
   * @param data Flat storage of length n^4
   * @throws ShapeMismatch if data.size() != n^4
   */
  InteractionTensor(std::size_t n, storage_type data)
      : _n(n), _data(std::move(data)) {
    if (static_cast<std::size_t>(_data.size()) != n * n * n * n) {
      throw ShapeMismatch("flat storage of length " +
                          std::to_string(_data.size()) +
                          " is not a rank-4 tensor with N = " +
                          std::to_string(n));
    }
  }

  static InteractionTensor Zero(std::size_t n) { return InteractionTensor(n); }

  /**
   * @brief Tensor with uniformly random entries in [-1, 1] (both parts for
   * complex scalars), drawn from Eigen's generator
   */
  static InteractionTensor Random(std::size_t n) {
    return InteractionTensor(n, storage_type::Random(n * n * n * n));
  }

  std::size_t dimension() const { return _n; }

  std::size_t size() const { return static_cast<std::size_t>(_data.size()); }

  /// Flat offset of element (i,j,k,l)
  std::size_t index(std::size_t i, std::size_t j, std::size_t k,
                    std::size_t l) const {
    return ((i * _n + j) * _n + k) * _n + l;
  }

  Scalar& operator()(std::size_t i, std::size_t j, std::size_t k,
                     std::size_t l) {
    return _data[index(i, j, k, l)];
  }

  const Scalar& operator()(std::size_t i, std::size_t j, std::size_t k,
                           std::size_t l) const {
    return _data[index(i, j, k, l)];
  }

  storage_type& data() { return _data; }
  const storage_type& data() const { return _data; }

  /**
   * @brief Largest absolute value of any element, 0 for an empty tensor
   */
  double max_abs() const {
    return _data.size() == 0 ? 0.0 : _data.cwiseAbs().maxCoeff();
  }

  /**
   * @brief Element-wise conversion to another scalar field
   */
  template <ScalarField Other>
  InteractionTensor<Other> cast() const {
    return InteractionTensor<Other>(_n, _data.template cast<Other>());
  }

  InteractionTensor& operator+=(const InteractionTensor& other) {
    _check_same_shape(other);
    _data += other._data;
    return *this;
  }

  InteractionTensor& operator-=(const InteractionTensor& other) {
    _check_same_shape(other);
    _data -= other._data;
    return *this;
  }

  InteractionTensor& operator*=(const Scalar& factor) {
    _data *= factor;
    return *this;
  }

  friend InteractionTensor operator+(InteractionTensor lhs,
                                     const InteractionTensor& rhs) {
    lhs += rhs;
    return lhs;
  }

  friend InteractionTensor operator-(InteractionTensor lhs,
                                     const InteractionTensor& rhs) {
    lhs -= rhs;
    return lhs;
  }

  friend InteractionTensor operator-(InteractionTensor t) {
    t._data = -t._data;
    return t;
  }

  friend InteractionTensor operator*(InteractionTensor t,
                                     const Scalar& factor) {
    t *= factor;
    return t;
  }

  friend InteractionTensor operator*(const Scalar& factor,
                                     InteractionTensor t) {
    t *= factor;
    return t;
  }

 private:
  void _check_same_shape(const InteractionTensor& other) const {
    if (other._n != _n) {
      throw ShapeMismatch("tensors with N = " + std::to_string(_n) +
                          " and N = " + std::to_string(other._n));
    }
  }

  std::size_t _n = 0;
  storage_type _data;
};

}  // namespace flowcore::data
