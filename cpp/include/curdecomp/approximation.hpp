#pragma once

/**
 * CUR reconstruction
 *
 * Given A_c (selected columns) and A_r (selected rows, or a stand-in for
 * them), S = pinv(A_c) A pinv(A_r) is the minimal-norm middle factor and
 * A_c S A_r the best reconstruction of A for that choice of factors.
 */

#include "curdecomp/types.hpp"

#include <optional>

namespace curdecomp {

constexpr double kProjectorThreshold = 1e-12;

/**
 * One CUR decomposition A ~ A_c * S * A_r together with the index lists
 * that produced it.
 */
struct Decomposition {
    Matrix A_c;
    Matrix S;
    Matrix A_r;
    Indices idx_c;
    Indices idx_r;
    bool complete = true;  // false if selection returned fewer indices than asked for

    Matrix reconstruct() const { return A_c * (S * A_r); }
};

/**
 * S = pinv(A_c) * A * pinv(A_r)
 */
Matrix middle_matrix(const Matrix& A, const Matrix& A_c, const Matrix& A_r);

/**
 * Reconstruct A from explicit index lists.
 *
 * With idx_r: A_c * S * A_r with A_r = A[idx_r, :].
 * Without:    A_c * pinv(A_c) * A, the projection of A onto the span of the
 *             selected columns.
 */
Matrix approximate(const Matrix& A, const Indices& idx_c,
                   const std::optional<Indices>& idx_r = std::nullopt);

/**
 * Latent-space projector from a decomposition.
 *
 * Eigendecomposes (S A_r)(S A_r)^T, clamps eigenvalues below `thresh` to
 * zero and returns U * diag(sqrt(v)), eigenpairs in ascending order.
 */
Matrix compute_projector(const Matrix& A_c, const Matrix& S, const Matrix& A_r,
                         double thresh = kProjectorThreshold);

/**
 * ||A - approx||_F / ||A||_F
 */
double relative_error(const Matrix& A, const Matrix& approx);

} // namespace curdecomp
