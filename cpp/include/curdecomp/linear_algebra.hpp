#pragma once

/**
 * Linear Algebra Wrappers
 *
 * Thin layer over Eigen giving the CUR code the handful of dense
 * decompositions it needs, with numpy-compatible cutoffs and ordering:
 *
 * - truncated_svd:  top-k singular triplets, descending
 * - symmetric_eig:  eigenpairs of a symmetric matrix, ascending
 * - sorted_eig:     eigenpairs sorted descending, thresholded and truncated
 * - pinv:           Moore-Penrose pseudoinverse
 */

#include "curdecomp/types.hpp"

namespace curdecomp {
namespace la {

// =============================================================================
// SVD
// =============================================================================

struct SvdResult {
    Vector singular_values;  // Descending, length k
    Matrix U;                // rows x k
    Matrix V;                // cols x k (right singular vectors as columns)
};

/**
 * Truncated SVD: the k largest singular triplets of M.
 * k is clamped to min(rows, cols).
 */
SvdResult truncated_svd(const Matrix& M, Index k);

// =============================================================================
// Symmetric eigenproblems
// =============================================================================

/**
 * SYEV: Solve symmetric eigenvalue problem A*x = lambda*x
 * Returns eigenvalues in ascending order, eigenvectors as columns
 */
struct EigResult {
    Vector eigenvalues;
    Matrix eigenvectors;
};

EigResult symmetric_eig(const Matrix& A);

/**
 * Eigendecomposition sorted by descending eigenvalue.
 *
 * Eigenpairs whose eigenvalue is strictly below `thresh` have both the
 * eigenvalue and the eigenvector zeroed (they keep their position).
 * The result is then truncated to the first `n` pairs; n < 0 keeps all.
 */
EigResult sorted_eig(const Matrix& A, double thresh = 0.0, Index n = -1);

// =============================================================================
// Pseudoinverse
// =============================================================================

/**
 * Moore-Penrose pseudoinverse. Singular values not larger than
 * rcond * sigma_max are treated as zero.
 */
Matrix pinv(const Matrix& M, double rcond = 1e-15);

// =============================================================================
// Slicing
// =============================================================================

/**
 * Gather the listed columns (rows) of M, in list order.
 * @throws InvalidArgumentError on an out-of-range index
 */
Matrix take_columns(const Matrix& M, const Indices& idx);
Matrix take_rows(const Matrix& M, const Indices& idx);

} // namespace la
} // namespace curdecomp
