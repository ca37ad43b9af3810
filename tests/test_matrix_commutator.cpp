// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdlib>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/utils/omp_utils.hpp>

#include "ut_common.hpp"

using namespace flowcore::algorithms;
using namespace flowcore::data;

class MatrixCommutatorTest : public ::testing::Test {
 protected:
  void SetUp() override { std::srand(42); }
};

TEST_F(MatrixCommutatorTest, PauliMatrices) {
  Eigen::MatrixXd z(2, 2), x(2, 2);
  z << 1, 0, 0, -1;
  x << 0, 1, 1, 0;

  Eigen::MatrixXd expected(2, 2);
  expected << 0, 2, -2, 0;

  auto c = kernels::commutator(z, x, MirrorSymmetry::Antisymmetric);
  EXPECT_TRUE(c.isApprox(expected));
  EXPECT_TRUE(kernels::commutator_reference(z, x).isApprox(expected));
}

TEST_F(MatrixCommutatorTest, SymmetricInputsMatchReference) {
  const Eigen::Index n = 10;
  Eigen::MatrixXd a = testing::random_symmetric(n);
  Eigen::MatrixXd b = testing::random_symmetric(n);

  // The commutator of two symmetric matrices is antisymmetric
  auto optimized = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric);
  auto reference = kernels::commutator_reference(a, b);
  EXPECT_LT((optimized - reference).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
}

TEST_F(MatrixCommutatorTest, SymmetricMirror) {
  const Eigen::Index n = 7;
  Eigen::MatrixXd sym = testing::random_symmetric(n);
  Eigen::MatrixXd anti = Eigen::MatrixXd::Random(n, n);
  anti = 0.5 * (anti - anti.transpose()).eval();

  // [symmetric, antisymmetric] is symmetric
  auto optimized = kernels::commutator(sym, anti, MirrorSymmetry::Symmetric);
  auto reference = kernels::commutator_reference(sym, anti);
  EXPECT_LT((optimized - reference).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
  EXPECT_TRUE(optimized == optimized.transpose());
}

TEST_F(MatrixCommutatorTest, Antisymmetry) {
  const Eigen::Index n = 6;
  Eigen::MatrixXd a = Eigen::MatrixXd::Random(n, n);
  Eigen::MatrixXd b = Eigen::MatrixXd::Random(n, n);

  auto ab = kernels::commutator_reference(a, b);
  auto ba = kernels::commutator_reference(b, a);
  EXPECT_LT((ab + ba).cwiseAbs().maxCoeff(),
            testing::numerical_zero_tolerance);

  Eigen::MatrixXd sa = testing::random_symmetric(n);
  Eigen::MatrixXd sb = testing::random_symmetric(n);
  auto sab = kernels::commutator(sa, sb, MirrorSymmetry::Antisymmetric);
  auto sba = kernels::commutator(sb, sa, MirrorSymmetry::Antisymmetric);
  EXPECT_LT((sab + sba).cwiseAbs().maxCoeff(),
            testing::numerical_zero_tolerance);
}

TEST_F(MatrixCommutatorTest, LowerTriangleFollowsDeclaredSymmetry) {
  const Eigen::Index n = 5;
  Eigen::MatrixXd a = Eigen::MatrixXd::Random(n, n);
  Eigen::MatrixXd b = Eigen::MatrixXd::Random(n, n);

  auto sym = kernels::commutator(a, b, MirrorSymmetry::Symmetric);
  auto anti = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric);
  for (Eigen::Index i = 0; i < n; ++i) {
    for (Eigen::Index j = i + 1; j < n; ++j) {
      EXPECT_EQ(sym(j, i), sym(i, j));
      EXPECT_EQ(anti(j, i), -anti(i, j));
      EXPECT_EQ(sym(i, j), anti(i, j));
    }
  }
}

TEST_F(MatrixCommutatorTest, HermitianWithAntiHermitian) {
  const Eigen::Index n = 6;
  Eigen::MatrixXcd h = testing::random_hermitian(n);
  Eigen::MatrixXcd g = testing::random_antihermitian(n);

  // [Hermitian, anti-Hermitian] is Hermitian
  auto optimized = kernels::commutator(h, g, MirrorSymmetry::Symmetric, true);
  auto reference = kernels::commutator_reference(h, g);
  EXPECT_LT((optimized - reference).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
}

TEST_F(MatrixCommutatorTest, HermitianPairIsAntiHermitian) {
  const Eigen::Index n = 6;
  Eigen::MatrixXcd h1 = testing::random_hermitian(n);
  Eigen::MatrixXcd h2 = testing::random_hermitian(n);

  auto optimized =
      kernels::commutator(h1, h2, MirrorSymmetry::Antisymmetric, true);
  auto reference = kernels::commutator_reference(h1, h2);
  EXPECT_LT((optimized - reference).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
  EXPECT_LT((optimized + optimized.adjoint()).cwiseAbs().maxCoeff(),
            testing::numerical_zero_tolerance);
}

TEST_F(MatrixCommutatorTest, ConjugationIsIdentityOverReals) {
  const Eigen::Index n = 4;
  Eigen::MatrixXd a = testing::random_symmetric(n);
  Eigen::MatrixXd b = testing::random_symmetric(n);

  auto plain = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric, false);
  auto conj = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric, true);
  EXPECT_TRUE(plain == conj);
}

TEST_F(MatrixCommutatorTest, ThreadCountDoesNotChangeResult) {
  const Eigen::Index n = 9;
  Eigen::MatrixXd a = testing::random_symmetric(n);
  Eigen::MatrixXd b = testing::random_symmetric(n);

  auto serial = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric,
                                    false, 1);
  auto parallel = kernels::commutator(a, b, MirrorSymmetry::Antisymmetric,
                                      false, 4);
  EXPECT_TRUE(serial == parallel);
}

TEST_F(MatrixCommutatorTest, ResolveNumThreads) {
  EXPECT_EQ(flowcore::utils::resolve_num_threads(3), 3);
  EXPECT_EQ(flowcore::utils::resolve_num_threads(0), omp_get_max_threads());
  EXPECT_GE(flowcore::utils::resolve_num_threads(0), 1);
  EXPECT_GE(flowcore::utils::resolve_num_threads(-2), 1);
}

TEST_F(MatrixCommutatorTest, ShapeMismatch) {
  Eigen::MatrixXd a3 = Eigen::MatrixXd::Random(3, 3);
  Eigen::MatrixXd a4 = Eigen::MatrixXd::Random(4, 4);
  Eigen::MatrixXd rect = Eigen::MatrixXd::Random(3, 4);

  EXPECT_THROW(kernels::commutator(a3, a4), flowcore::data::ShapeMismatch);
  EXPECT_THROW(kernels::commutator_reference(a3, a4),
               flowcore::data::ShapeMismatch);
  EXPECT_THROW(kernels::commutator(rect, a3), flowcore::data::ShapeMismatch);
  EXPECT_THROW(kernels::commutator_reference(a3, rect),
               std::invalid_argument);
}

TEST_F(MatrixCommutatorTest, EmptyMatrices) {
  Eigen::MatrixXcd a(0, 0), b(0, 0);
  auto c = kernels::commutator(a, b);
  EXPECT_EQ(c.rows(), 0);
  EXPECT_EQ(c.cols(), 0);
}
