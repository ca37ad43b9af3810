// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file flow_step.cpp
 * @brief One step of a flow equation evaluated with flowcore
 *
 * This example demonstrates the contractions needed by a single step of an
 * in-medium similarity renormalization group style flow:
 * 1. Building a random one-body operator f and two-body operator G
 * 2. Building the generator eta = [f_d, f] + [G, f_d] from the diagonal f_d
 * 3. Evaluating the commutators [eta, f] and [eta, G]
 * 4. Evaluating the normal-ordering corrections relative to a Fermi sea
 *
 * Usage:
 *   ./flow_step_example          # 6 modes, 3 occupied
 *   ./flow_step_example 8 2      # 8 modes, 2 occupied
 *   ./flow_step_example 8 2 4    # ... on 4 threads
 */

// flowcore Header Files
// One can also include <flowcore.hpp> to get all flowcore components
#include <flowcore/algorithms/contraction.hpp>
#include <flowcore/data/operand.hpp>
#include <flowcore/data/reference_state.hpp>
#include <flowcore/utils/logger.hpp>

// Standard Library Header Files
#include <complex>   // for std::complex
#include <iomanip>   // for std::setprecision
#include <iostream>  // for std::cout
#include <string>    // for std::stoul

namespace data = flowcore::data;
namespace algorithms = flowcore::algorithms;

using cplx = std::complex<double>;

int main(int argc, char** argv) {
  // ==========================================================================
  // STEP 1: INPUT PARSING
  // ==========================================================================

  const std::size_t n = argc > 1 ? std::stoul(argv[1]) : 6;
  const std::size_t n_occ = argc > 2 ? std::stoul(argv[2]) : n / 2;
  const int num_threads = argc > 3 ? std::stoi(argv[3]) : 0;

  flowcore::utils::set_log_level("info");

  auto state = data::ReferenceState::fermi_sea(n, n_occ);
  std::cout << state.get_summary() << "\n";

  // ==========================================================================
  // STEP 2: OPERATORS AND GENERATOR
  // ==========================================================================

  const auto dim = static_cast<Eigen::Index>(n);
  Eigen::MatrixXcd f = Eigen::MatrixXcd::Random(dim, dim);
  f = (0.5 * (f + f.adjoint())).eval();
  Eigen::MatrixXcd f_diag = f.diagonal().asDiagonal();
  auto g = data::InteractionTensor<cplx>::Random(n);

  auto engine = algorithms::ContractionEngineFactory::create();
  engine->settings().set("num_threads", num_threads);
  spdlog::info("Using contraction engine '{}' (available: {})",
               engine->name(),
               algorithms::ContractionEngineFactory::available().size());

  // The commutator of two Hermitian matrices is anti-Hermitian
  algorithms::ContractionOptions options;
  options.symmetry = algorithms::MirrorSymmetry::Antisymmetric;
  options.hermitian = true;

  data::Operand eta1 = engine->run(f_diag, f, options);
  data::Operand eta2 = engine->run(g, f_diag, algorithms::ContractionOptions{});

  std::cout << "Generator:\n";
  std::cout << "  eta (one-body): " << eta1.describe() << "\n";
  std::cout << "  eta (two-body): " << eta2.describe() << "\n\n";

  // ==========================================================================
  // STEP 3: COMMUTATORS
  // ==========================================================================

  // [eta, f] is Hermitian for anti-Hermitian eta and Hermitian f
  options.symmetry = algorithms::MirrorSymmetry::Symmetric;
  auto df_1b = engine->run(eta1, f, options);
  auto dg_2b = engine->run(eta2, f, algorithms::ContractionOptions{});
  auto dg_mixed = engine->run(eta1, g, algorithms::ContractionOptions{});

  // ==========================================================================
  // STEP 4: NORMAL-ORDERING CORRECTIONS
  // ==========================================================================

  algorithms::ContractionOptions no_options;
  no_options.mode = algorithms::ContractionMode::NormalOrdering;
  no_options.state = std::make_shared<const data::ReferenceState>(state);

  auto df_no = engine->run(eta2, f, no_options);
  auto dg_no = engine->run(eta2, g, no_options);

  const double df_norm = df_1b.complex_matrix().cwiseAbs().maxCoeff();
  const double df_no_norm = df_no.complex_matrix().cwiseAbs().maxCoeff();

  std::cout << std::scientific << std::setprecision(6);
  std::cout << "Flow derivatives (max |element|):\n";
  std::cout << "  [eta1, f]       " << df_norm << "\n";
  std::cout << "  [eta2, f]       " << dg_2b.complex_tensor().max_abs() << "\n";
  std::cout << "  [eta1, G]       " << dg_mixed.complex_tensor().max_abs()
            << "\n";
  std::cout << "  NO(eta2, f)     " << df_no_norm << "\n";
  std::cout << "  NO(eta2, G)     " << dg_no.complex_tensor().max_abs()
            << "\n\n";

  std::cout << "Flow step completed successfully!\n";
  return 0;
}
