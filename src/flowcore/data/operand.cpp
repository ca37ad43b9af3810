// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <flowcore/data/operand.hpp>
#include <type_traits>

namespace flowcore::data {

namespace {

template <typename Derived>
void require_square(const Eigen::MatrixBase<Derived>& m) {
  if (m.rows() != m.cols()) {
    throw ShapeMismatch("matrix operand is " + std::to_string(m.rows()) +
                        "x" + std::to_string(m.cols()) + ", expected square");
  }
}

}  // namespace

Operand::Operand(Eigen::MatrixXd m) : _value(std::move(m)) {
  require_square(std::get<Eigen::MatrixXd>(_value));
}

Operand::Operand(Eigen::MatrixXcd m) : _value(std::move(m)) {
  require_square(std::get<Eigen::MatrixXcd>(_value));
}

Operand::Operand(InteractionTensor<double> t) : _value(std::move(t)) {}

Operand::Operand(InteractionTensor<std::complex<double>> t)
    : _value(std::move(t)) {}

int Operand::rank() const {
  return (std::holds_alternative<Eigen::MatrixXd>(_value) ||
          std::holds_alternative<Eigen::MatrixXcd>(_value))
             ? 2
             : 4;
}

std::size_t Operand::dimension() const {
  return std::visit(
      [](const auto& v) -> std::size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_base_of_v<Eigen::EigenBase<T>, T>) {
          return static_cast<std::size_t>(v.rows());
        } else {
          return v.dimension();
        }
      },
      _value);
}

bool Operand::is_complex() const {
  return std::holds_alternative<Eigen::MatrixXcd>(_value) ||
         std::holds_alternative<InteractionTensor<std::complex<double>>>(
             _value);
}

const Eigen::MatrixXd& Operand::real_matrix() const {
  return std::get<Eigen::MatrixXd>(_value);
}

const Eigen::MatrixXcd& Operand::complex_matrix() const {
  return std::get<Eigen::MatrixXcd>(_value);
}

const InteractionTensor<double>& Operand::real_tensor() const {
  return std::get<InteractionTensor<double>>(_value);
}

const InteractionTensor<std::complex<double>>& Operand::complex_tensor()
    const {
  return std::get<InteractionTensor<std::complex<double>>>(_value);
}

Operand Operand::to_complex() const {
  return std::visit(
      [](const auto& v) -> Operand {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Eigen::MatrixXd>) {
          return Operand(
              Eigen::MatrixXcd(v.template cast<std::complex<double>>()));
        } else if constexpr (std::is_same_v<T, InteractionTensor<double>>) {
          return Operand(v.template cast<std::complex<double>>());
        } else {
          return Operand(v);
        }
      },
      _value);
}

std::string Operand::describe() const {
  return std::string(is_complex() ? "complex" : "real") + " rank-" +
         std::to_string(rank()) + " (N=" + std::to_string(dimension()) + ")";
}

}  // namespace flowcore::data
