// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <flowcore/algorithms/contraction.hpp>
#include <flowcore/utils/logger.hpp>
#include <optional>

#include "native/optimized_contraction.hpp"
#include "native/reference_contraction.hpp"

namespace flowcore::algorithms {

namespace {

const char* mode_name(ContractionMode mode) {
  return mode == ContractionMode::Commutator ? "commutator" : "normal ordering";
}

}  // namespace

std::string to_string(ContractionVariant variant) {
  switch (variant) {
    case ContractionVariant::Reference:
      return "reference";
    case ContractionVariant::SymmetryOptimized:
      return "symmetry_optimized";
  }
  throw std::invalid_argument("Unknown contraction variant");
}

int ContractionEngine::num_threads() const {
  return static_cast<int>(
      _settings->get_or_default<int64_t>("num_threads", int64_t(0)));
}

data::Operand ContractionEngine::_run_impl(
    const data::Operand& a, const data::Operand& b,
    const ContractionOptions& options) const {
  FLOWCORE_LOG_TRACE_ENTERING();
  if (a.dimension() != b.dimension()) {
    throw data::ShapeMismatch("cannot contract " + a.describe() + " with " +
                              b.describe());
  }
  if (options.mode == ContractionMode::NormalOrdering) {
    if (!options.state) {
      throw UnsupportedOperation("normal ordering requires a reference state");
    }
    if (options.state->size() != a.dimension()) {
      throw data::ShapeMismatch(
          "reference state with " + std::to_string(options.state->size()) +
          " modes for operands of dimension " +
          std::to_string(a.dimension()));
    }
  }

  if (!a.is_complex() && !b.is_complex()) {
    return _dispatch<double>(a, b, options);
  }

  // Promote the real operand, if any
  std::optional<data::Operand> promoted_a;
  std::optional<data::Operand> promoted_b;
  if (!a.is_complex()) {
    spdlog::debug("Promoting left operand {} to complex", a.describe());
    promoted_a = a.to_complex();
  }
  if (!b.is_complex()) {
    spdlog::debug("Promoting right operand {} to complex", b.describe());
    promoted_b = b.to_complex();
  }
  return _dispatch<std::complex<double>>(promoted_a ? *promoted_a : a,
                                         promoted_b ? *promoted_b : b, options);
}

template <data::ScalarField Scalar>
data::Operand ContractionEngine::_dispatch(
    const data::Operand& a, const data::Operand& b,
    const ContractionOptions& options) const {
  const int rank_a = a.rank();
  const int rank_b = b.rank();
  spdlog::debug("{}: {} of rank {} x {} (N={})", name(),
                mode_name(options.mode), rank_a, rank_b, a.dimension());

  if (options.mode == ContractionMode::Commutator) {
    if (rank_a == 2 && rank_b == 2) {
      return data::Operand(
          _commutator(a.matrix<Scalar>(), b.matrix<Scalar>(), options));
    }
    if (rank_a == 4 && rank_b == 2) {
      return data::Operand(
          _tensor_commutator(a.tensor<Scalar>(), b.matrix<Scalar>()));
    }
    if (rank_a == 2 && rank_b == 4) {
      return data::Operand(
          -_tensor_commutator(b.tensor<Scalar>(), a.matrix<Scalar>()));
    }
    throw UnsupportedOperation("commutator of two rank-4 operands");
  }

  if (!supports_normal_ordering()) {
    spdlog::warn(
        "Contraction engine '{}' does not support normal ordering, using the "
        "{} kernels instead",
        name(), to_string(ContractionVariant::SymmetryOptimized));
  }

  const data::ReferenceState& state = *options.state;
  const int threads = num_threads();
  if (rank_a == 2 && rank_b == 2) {
    // No single contraction exists between two one-body operators
    const auto n = static_cast<Eigen::Index>(a.dimension());
    data::Matrix<Scalar> zero = data::Matrix<Scalar>::Zero(n, n);
    return data::Operand(std::move(zero));
  }
  if (rank_a == 4 && rank_b == 2) {
    return data::Operand(kernels::normal_order_two_body(
        a.tensor<Scalar>(), b.matrix<Scalar>(), state, threads));
  }
  if (rank_a == 2 && rank_b == 4) {
    return data::Operand(kernels::normal_order_two_body_mirror(
        a.matrix<Scalar>(), b.tensor<Scalar>(), state, threads));
  }
  return data::Operand(kernels::normal_order_four_body(
      a.tensor<Scalar>(), b.tensor<Scalar>(), state, options.channels,
      threads));
}

std::unique_ptr<ContractionEngine> make_reference_contraction() {
  return std::make_unique<native::ReferenceContraction>();
}

std::unique_ptr<ContractionEngine> make_optimized_contraction() {
  return std::make_unique<native::SymmetryOptimizedContraction>();
}

void ContractionEngineFactory::register_default_instances() {
  ContractionEngineFactory::register_instance(&make_reference_contraction);
  ContractionEngineFactory::register_instance(&make_optimized_contraction);
}

data::Operand contract(const data::Operand& a, const data::Operand& b,
                       const ContractionOptions& options) {
  FLOWCORE_LOG_TRACE_ENTERING();
  ContractionOptions commutator_options = options;
  commutator_options.mode = ContractionMode::Commutator;
  auto engine = ContractionEngineFactory::create();
  return engine->run(a, b, commutator_options);
}

data::Operand contract_normal_ordered(const data::Operand& a,
                                      const data::Operand& b,
                                      const data::ReferenceState& state,
                                      const ContractionOptions& options) {
  FLOWCORE_LOG_TRACE_ENTERING();
  ContractionOptions no_options = options;
  no_options.mode = ContractionMode::NormalOrdering;
  no_options.state = std::make_shared<const data::ReferenceState>(state);
  auto engine = ContractionEngineFactory::create();
  return engine->run(a, b, no_options);
}

}  // namespace flowcore::algorithms
