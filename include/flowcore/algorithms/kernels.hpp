// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <flowcore/data/reference_state.hpp>
#include <flowcore/data/tensor.hpp>

/**
 * @file kernels.hpp
 * @brief Commutator and normal-ordering contraction kernels
 *
 * All kernels take operands over a single scalar field, validate shapes
 * before computing, and return a freshly allocated result. Index conventions
 * for rank-4 operands follow data::InteractionTensor. Every kernel is
 * instantiated for double and std::complex<double>.
 *
 * Parallel kernels take a thread count; 0 selects the OpenMP runtime default.
 */

namespace flowcore::algorithms {

/**
 * @brief Relation between the two triangles of a matrix commutator
 */
enum class MirrorSymmetry {
  Symmetric,     ///< C(j,i) = C(i,j), or conj(C(i,j)) for Hermitian inputs
  Antisymmetric  ///< C(j,i) = -C(i,j), or -conj(C(i,j)) for Hermitian inputs
};

/**
 * @brief Channels of the four-body normal-ordering correction
 *
 * Values combine as bit flags; All is the sum of both channels.
 */
enum class NormalOrderChannel : unsigned {
  Density = 1,  ///< Particle-hole terms, weighted by n_l - n_m
  Pairing = 2,  ///< Particle-particle terms, weighted by n_l + n_m
  All = 3
};

inline bool has_channel(NormalOrderChannel set, NormalOrderChannel channel) {
  return (static_cast<unsigned>(set) & static_cast<unsigned>(channel)) != 0;
}

namespace kernels {

/**
 * @brief Commutator of two square matrices, C = AB - BA
 *
 * Only the diagonal and upper triangle are computed; the lower triangle is
 * filled from the declared symmetry, which is not verified. With
 * @p hermitian set the mirror is conjugated, which is exact when the result
 * is known to be Hermitian (Symmetric) or anti-Hermitian (Antisymmetric).
 * Conjugation is the identity over the reals.
 *
 * @param a Square matrix A
 * @param b Square matrix B of the same dimension
 * @param symmetry Declared symmetry of the result
 * @param hermitian Whether the mirror is conjugated
 * @param num_threads Thread count, 0 for the runtime default
 * @throws data::ShapeMismatch if A or B is not square or the dimensions differ
 */
template <data::ScalarField Scalar>
data::Matrix<Scalar> commutator(
    const data::Matrix<Scalar>& a, const data::Matrix<Scalar>& b,
    MirrorSymmetry symmetry = MirrorSymmetry::Symmetric,
    bool hermitian = false, int num_threads = 0);

/**
 * @brief Commutator of two square matrices from full matrix products
 * @throws data::ShapeMismatch if A or B is not square or the dimensions differ
 */
template <data::ScalarField Scalar>
data::Matrix<Scalar> commutator_reference(const data::Matrix<Scalar>& a,
                                          const data::Matrix<Scalar>& b);

/**
 * @brief Commutator of a rank-4 tensor with a matrix
 *
 * C(i,j,k,q) = sum_l A(i,j,k,l) B(l,q) - A(i,j,l,q) B(k,l)
 *                    + A(i,l,k,q) B(l,j) - A(l,j,k,q) B(i,l)
 *
 * Evaluated element by element in one parallel loop.
 *
 * @throws data::ShapeMismatch if B is not square or its dimension differs
 * from that of A
 */
template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> tensor_commutator(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b,
    int num_threads = 0);

/**
 * @brief Same contraction as tensor_commutator, evaluated as four dense
 * matrix products over reshaped views of A
 */
template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> tensor_commutator_reference(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b);

/**
 * @brief Commutator of a matrix with a rank-4 tensor, -tensor_commutator(b, a)
 */
template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> matrix_tensor_commutator(
    const data::Matrix<Scalar>& a, const data::InteractionTensor<Scalar>& b,
    int num_threads = 0);

/**
 * @brief Single contractions of a rank-4 tensor with a matrix relative to a
 * reference state
 *
 * C(i,j) = sum_{k,q: n_k != n_q} (n_k - n_q) B(q,k)
 *          [A(i,j,k,q) + A(k,q,i,j) - A(k,j,i,q) + A(i,q,k,j)]
 *
 * Mode pairs with equal occupation never enter the loop.
 *
 * @throws data::ShapeMismatch if the dimensions of A, B and the state differ
 */
template <data::ScalarField Scalar>
data::Matrix<Scalar> normal_order_two_body(
    const data::InteractionTensor<Scalar>& a, const data::Matrix<Scalar>& b,
    const data::ReferenceState& state, int num_threads = 0);

/**
 * @brief Single contractions of a matrix with a rank-4 tensor,
 * -normal_order_two_body(b, a, state)
 */
template <data::ScalarField Scalar>
data::Matrix<Scalar> normal_order_two_body_mirror(
    const data::Matrix<Scalar>& a, const data::InteractionTensor<Scalar>& b,
    const data::ReferenceState& state, int num_threads = 0);

/**
 * @brief Single contractions of two rank-4 tensors relative to a reference
 * state
 *
 * Sums over an internal mode pair (l,m). The density channel only visits
 * pairs with n_l != n_m and is weighted by n_l - n_m:
 *
 *   + A(i,j,l,m) [B(m,l,k,q) + B(k,q,m,l) - B(m,q,k,l) + B(k,l,m,q)]
 *   + A(l,m,i,j) [B(m,l,k,q) + B(k,q,m,l) - B(m,q,k,l) + B(k,l,m,q)]
 *   - A(l,j,i,m) [B(m,l,k,q) + B(k,l,m,q) - B(m,q,k,l) + B(k,q,m,l)]
 *   + A(i,l,m,j) [B(k,m,l,q) + B(k,q,l,m) + B(l,m,k,q) - B(l,q,k,m)]
 *
 * The pairing channel visits every pair and is weighted by n_l + n_m:
 *
 *   + A(l,j,m,q) [B(i,m,k,l) + B(i,l,k,m)]
 *   + A(i,l,k,m) [B(m,j,l,q) + B(l,j,m,q)]
 *
 * @param channels Channels to accumulate
 * @throws data::ShapeMismatch if the dimensions of A, B and the state differ
 */
template <data::ScalarField Scalar>
data::InteractionTensor<Scalar> normal_order_four_body(
    const data::InteractionTensor<Scalar>& a,
    const data::InteractionTensor<Scalar>& b,
    const data::ReferenceState& state,
    NormalOrderChannel channels = NormalOrderChannel::All,
    int num_threads = 0);

}  // namespace kernels
}  // namespace flowcore::algorithms
