// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdlib>
#include <flowcore/algorithms/kernels.hpp>

#include "ut_common.hpp"

using namespace flowcore::algorithms;
using namespace flowcore::data;
using testing::cplx;

class NormalOrderingTest : public ::testing::Test {
 protected:
  void SetUp() override { std::srand(1234); }

  ReferenceState half_filled_{std::string("1010")};
};

TEST_F(NormalOrderingTest, TwoBodyMatchesDefinition) {
  const std::size_t n = 4;
  auto a = InteractionTensor<double>::Random(n);
  Eigen::MatrixXd b = Eigen::MatrixXd::Random(n, n);

  auto expected = testing::brute_force_two_body(a, b, half_filled_);
  auto c = kernels::normal_order_two_body(a, b, half_filled_);
  EXPECT_LT((c - expected).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
}

TEST_F(NormalOrderingTest, ComplexTwoBodyMatchesDefinition) {
  const std::size_t n = 4;
  auto a = InteractionTensor<cplx>::Random(n);
  Eigen::MatrixXcd b = Eigen::MatrixXcd::Random(n, n);
  auto state = ReferenceState::fermi_sea(n, 1);

  auto expected = testing::brute_force_two_body(a, b, state);
  auto c = kernels::normal_order_two_body(a, b, state);
  EXPECT_LT((c - expected).cwiseAbs().maxCoeff(),
            testing::contraction_tolerance);
}

TEST_F(NormalOrderingTest, TwoBodyMirrorIsExactNegation) {
  const std::size_t n = 4;
  Eigen::MatrixXd a = Eigen::MatrixXd::Random(n, n);
  auto b = InteractionTensor<double>::Random(n);

  auto mirrored = kernels::normal_order_two_body_mirror(a, b, half_filled_);
  Eigen::MatrixXd direct = kernels::normal_order_two_body(b, a, half_filled_);
  EXPECT_TRUE(mirrored == -direct);
}

TEST_F(NormalOrderingTest, TwoBodyPauliBlocking) {
  const std::size_t n = 5;
  auto a = InteractionTensor<double>::Random(n);
  Eigen::MatrixXd b = Eigen::MatrixXd::Random(n, n);

  for (const auto& uniform : {ReferenceState::fermi_sea(n, 0),
                              ReferenceState::fermi_sea(n, n)}) {
    auto c = kernels::normal_order_two_body(a, b, uniform);
    EXPECT_TRUE(c.isZero(0.0));
  }
}

TEST_F(NormalOrderingTest, FourBodyMatchesDefinition) {
  const std::size_t n = 4;
  auto a = InteractionTensor<double>::Random(n);
  auto b = InteractionTensor<double>::Random(n);

  auto expected =
      testing::brute_force_four_body(a, b, half_filled_, true, true);
  auto c = kernels::normal_order_four_body(a, b, half_filled_);
  EXPECT_LT(testing::max_abs_diff(c, expected), testing::contraction_tolerance);
}

TEST_F(NormalOrderingTest, FourBodyChannels) {
  const std::size_t n = 4;
  auto a = InteractionTensor<double>::Random(n);
  auto b = InteractionTensor<double>::Random(n);

  auto density = kernels::normal_order_four_body(a, b, half_filled_,
                                                 NormalOrderChannel::Density);
  auto pairing = kernels::normal_order_four_body(a, b, half_filled_,
                                                 NormalOrderChannel::Pairing);
  auto all = kernels::normal_order_four_body(a, b, half_filled_,
                                             NormalOrderChannel::All);

  EXPECT_LT(testing::max_abs_diff(
                density, testing::brute_force_four_body(a, b, half_filled_,
                                                        true, false)),
            testing::contraction_tolerance);
  EXPECT_LT(testing::max_abs_diff(
                pairing, testing::brute_force_four_body(a, b, half_filled_,
                                                        false, true)),
            testing::contraction_tolerance);
  EXPECT_LT(testing::max_abs_diff(all, density + pairing),
            testing::contraction_tolerance);
}

TEST_F(NormalOrderingTest, FourBodyDensityPauliBlocking) {
  const std::size_t n = 3;
  auto a = InteractionTensor<double>::Random(n);
  auto b = InteractionTensor<double>::Random(n);

  auto empty = ReferenceState::fermi_sea(n, 0);
  auto filled = ReferenceState::fermi_sea(n, n);

  EXPECT_EQ(kernels::normal_order_four_body(a, b, empty,
                                            NormalOrderChannel::Density)
                .max_abs(),
            0.0);
  EXPECT_EQ(kernels::normal_order_four_body(a, b, filled,
                                            NormalOrderChannel::Density)
                .max_abs(),
            0.0);
  // The pairing channel vanishes only for the empty state
  EXPECT_EQ(kernels::normal_order_four_body(a, b, empty).max_abs(), 0.0);
  EXPECT_GT(kernels::normal_order_four_body(a, b, filled).max_abs(), 0.0);
}

TEST_F(NormalOrderingTest, FourBodyIsLinearInFirstArgument) {
  const std::size_t n = 3;
  auto a1 = InteractionTensor<cplx>::Random(n);
  auto a2 = InteractionTensor<cplx>::Random(n);
  auto b = InteractionTensor<cplx>::Random(n);
  auto state = ReferenceState::fermi_sea(n, 2);
  const cplx alpha(0.5, -2.0);

  auto combined =
      kernels::normal_order_four_body(InteractionTensor<cplx>(a1 + alpha * a2),
                                      b, state);
  auto separate = kernels::normal_order_four_body(a1, b, state) +
                  alpha * kernels::normal_order_four_body(a2, b, state);
  EXPECT_LT(testing::max_abs_diff(combined, separate),
            testing::contraction_tolerance);
}

TEST_F(NormalOrderingTest, NoChannelsGivesZero) {
  auto a = InteractionTensor<double>::Random(2);
  auto b = InteractionTensor<double>::Random(2);
  auto c = kernels::normal_order_four_body(a, b, ReferenceState("10"),
                                           static_cast<NormalOrderChannel>(0));
  EXPECT_EQ(c.max_abs(), 0.0);
}

TEST_F(NormalOrderingTest, StateLengthMismatch) {
  auto a = InteractionTensor<double>::Random(3);
  Eigen::MatrixXd b = Eigen::MatrixXd::Random(3, 3);
  auto b4 = InteractionTensor<double>::Random(3);

  EXPECT_THROW(kernels::normal_order_two_body(a, b, half_filled_),
               ShapeMismatch);
  EXPECT_THROW(kernels::normal_order_two_body_mirror(b, a, half_filled_),
               ShapeMismatch);
  EXPECT_THROW(kernels::normal_order_four_body(a, b4, half_filled_),
               ShapeMismatch);
}

TEST_F(NormalOrderingTest, OperandDimensionMismatch) {
  auto a = InteractionTensor<double>::Random(4);
  auto b3 = InteractionTensor<double>::Random(3);
  Eigen::MatrixXd m3 = Eigen::MatrixXd::Random(3, 3);

  EXPECT_THROW(kernels::normal_order_two_body(a, m3, half_filled_),
               ShapeMismatch);
  EXPECT_THROW(kernels::normal_order_four_body(a, b3, half_filled_),
               ShapeMismatch);
}
