// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <complex>
#include <flowcore/algorithms/algorithm.hpp>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/data/operand.hpp>
#include <flowcore/data/reference_state.hpp>
#include <flowcore/data/settings.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace flowcore::algorithms {

/**
 * @brief Exception thrown for a rank combination the requested contraction
 * does not define, or a normal ordering request without a reference state
 */
class UnsupportedOperation : public std::invalid_argument {
 public:
  explicit UnsupportedOperation(const std::string& what)
      : std::invalid_argument("Unsupported operation: " + what) {}
};

/**
 * @brief Kind of contraction requested from a ContractionEngine
 */
enum class ContractionMode {
  Commutator,     ///< Full commutator [A, B]
  NormalOrdering  ///< Single contractions relative to a reference state
};

/**
 * @brief Built-in ContractionEngine implementations
 */
enum class ContractionVariant {
  Reference,         ///< "reference": full products, no normal ordering
  SymmetryOptimized  ///< "symmetry_optimized": triangle-only loops
};

/// Registry name of a built-in variant
std::string to_string(ContractionVariant variant);

/**
 * @brief Per-call options of ContractionEngine::run
 */
struct ContractionOptions {
  ContractionMode mode = ContractionMode::Commutator;

  /// Declared symmetry of a matrix-matrix commutator
  MirrorSymmetry symmetry = MirrorSymmetry::Symmetric;

  /// Conjugate the mirrored triangle of a matrix-matrix commutator
  bool hermitian = false;

  /// Reference state, required for NormalOrdering
  std::shared_ptr<const data::ReferenceState> state;

  /// Channels of the tensor-tensor normal-ordering correction
  NormalOrderChannel channels = NormalOrderChannel::All;
};

/**
 * @class ContractionEngine
 * @brief Routes a pair of operands to the matching contraction kernel
 *
 * run() validates that both operands share one dimension N (and that the
 * reference state has N modes), promotes a real operand to complex when the
 * other is complex, and dispatches on the ranks and the mode:
 *
 * | mode           | ranks | result                                   |
 * |----------------|-------|------------------------------------------|
 * | Commutator     | 2 x 2 | matrix commutator                        |
 * | Commutator     | 4 x 2 | tensor commutator                        |
 * | Commutator     | 2 x 4 | negated tensor commutator, swapped       |
 * | Commutator     | 4 x 4 | UnsupportedOperation                     |
 * | NormalOrdering | 2 x 2 | zero matrix                              |
 * | NormalOrdering | 4 x 2 | two-body correction                      |
 * | NormalOrdering | 2 x 4 | negated two-body correction, swapped     |
 * | NormalOrdering | 4 x 4 | four-body correction                     |
 *
 * Implementations choose how the commutators are evaluated. Implementations
 * that do not support normal ordering fall back to the optimized
 * normal-ordering kernels with a warning.
 *
 * Settings:
 * - num_threads (int64, >= 0, default 0): worker threads of the parallel
 *   kernels, 0 for the OpenMP runtime default
 */
class ContractionEngine
    : public Algorithm<ContractionEngine, data::Operand, const data::Operand&,
                       const data::Operand&, const ContractionOptions&> {
 public:
  ContractionEngine() = default;
  virtual ~ContractionEngine() = default;

  /**
   * @brief Contract two operands
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param a Left operand
   * @param b Right operand
   * @param options Mode, symmetry declarations and reference state
   * \endcond
   * @return A new operand owned by the caller; complex if either input is
   * @throws data::ShapeMismatch if the dimensions disagree
   * @throws UnsupportedOperation if the rank combination is not defined for
   * the mode or the reference state is missing
   */
  using Algorithm::run;

  std::string type_name() const final { return "contraction_engine"; }

  /**
   * @brief Whether this implementation evaluates normal-ordering corrections
   * itself
   */
  virtual bool supports_normal_ordering() const { return true; }

 protected:
  data::Operand _run_impl(const data::Operand& a, const data::Operand& b,
                          const ContractionOptions& options) const final;

  /// Thread count of the parallel kernels, from the num_threads setting
  int num_threads() const;

  virtual data::Matrix<double> _commutator(
      const data::Matrix<double>& a, const data::Matrix<double>& b,
      const ContractionOptions& options) const = 0;
  virtual data::Matrix<std::complex<double>> _commutator(
      const data::Matrix<std::complex<double>>& a,
      const data::Matrix<std::complex<double>>& b,
      const ContractionOptions& options) const = 0;

  virtual data::InteractionTensor<double> _tensor_commutator(
      const data::InteractionTensor<double>& a,
      const data::Matrix<double>& b) const = 0;
  virtual data::InteractionTensor<std::complex<double>> _tensor_commutator(
      const data::InteractionTensor<std::complex<double>>& a,
      const data::Matrix<std::complex<double>>& b) const = 0;

 private:
  template <data::ScalarField Scalar>
  data::Operand _dispatch(const data::Operand& a, const data::Operand& b,
                          const ContractionOptions& options) const;
};

/**
 * @brief Settings shared by the built-in contraction engines
 */
class ContractionSettings : public data::Settings {
 public:
  ContractionSettings() {
    set_default("num_threads", int64_t(0),
                "Worker threads of the parallel kernels, 0 for the OpenMP "
                "runtime default",
                data::BoundConstraint<int64_t>{0, 4096});
  }
  ~ContractionSettings() override = default;
};

/**
 * @brief Factory of ContractionEngine implementations
 *
 * The built-in variants are registered as "reference" and
 * "symmetry_optimized"; the default is "symmetry_optimized".
 *
 * ```
 * auto engine =
 *     ContractionEngineFactory::create(ContractionVariant::Reference);
 * engine->settings().set("num_threads", 4);
 * auto c = engine->run(a, b, ContractionOptions{});
 * ```
 */
struct ContractionEngineFactory
    : public AlgorithmFactory<ContractionEngine, ContractionEngineFactory> {
  static std::string algorithm_type_name() { return "contraction_engine"; }
  static void register_default_instances();
  static std::string default_algorithm_name() {
    return to_string(ContractionVariant::SymmetryOptimized);
  }

  using AlgorithmFactory::create;

  static return_type create(ContractionVariant variant) {
    return create(to_string(variant));
  }
};

/**
 * @brief Commutator of two operands with the default engine
 *
 * The mode of @p options is ignored.
 */
data::Operand contract(const data::Operand& a, const data::Operand& b,
                       const ContractionOptions& options = {});

/**
 * @brief Normal-ordering correction of two operands with the default engine
 *
 * The mode and state of @p options are replaced by NormalOrdering and
 * @p state.
 */
data::Operand contract_normal_ordered(const data::Operand& a,
                                      const data::Operand& b,
                                      const data::ReferenceState& state,
                                      const ContractionOptions& options = {});

}  // namespace flowcore::algorithms
