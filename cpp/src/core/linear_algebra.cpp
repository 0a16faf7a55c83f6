/**
 * Linear Algebra Wrappers Implementation
 *
 * Backend: Eigen (BDCSVD, SelfAdjointEigenSolver)
 */

#include "curdecomp/linear_algebra.hpp"
#include "curdecomp/error.hpp"

#include <Eigen/SVD>
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <string>

namespace curdecomp {
namespace la {

// =============================================================================
// SVD
// =============================================================================

SvdResult truncated_svd(const Matrix& M, Index k) {
    CURDECOMP_CHECK_ARGUMENT(M.rows() > 0 && M.cols() > 0, "SVD of an empty matrix");
    CURDECOMP_CHECK_ARGUMENT(k > 0, "SVD rank must be positive, got " + std::to_string(k));

    Eigen::BDCSVD<Matrix> svd(M, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Index kk = std::min<Index>(k, svd.singularValues().size());

    SvdResult result;
    result.singular_values = svd.singularValues().head(kk);
    result.U = svd.matrixU().leftCols(kk);
    result.V = svd.matrixV().leftCols(kk);
    return result;
}

// =============================================================================
// Symmetric eigenproblems
// =============================================================================

EigResult symmetric_eig(const Matrix& A) {
    CURDECOMP_CHECK_ARGUMENT(A.rows() > 0, "Eigendecomposition of an empty matrix");
    CURDECOMP_CHECK_ARGUMENT(A.rows() == A.cols(),
        "Eigendecomposition needs a square matrix, got " +
        std::to_string(A.rows()) + "x" + std::to_string(A.cols()));

    Eigen::SelfAdjointEigenSolver<Matrix> solver(A);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("Symmetric eigensolver did not converge", __func__);
    }

    EigResult result;
    result.eigenvalues = solver.eigenvalues();
    result.eigenvectors = solver.eigenvectors();
    return result;
}

EigResult sorted_eig(const Matrix& A, double thresh, Index n) {
    EigResult ascending = symmetric_eig(A);
    const Index size = ascending.eigenvalues.size();
    const Index keep = (n < 0) ? size : std::min(n, size);

    EigResult result;
    result.eigenvalues.resize(keep);
    result.eigenvectors.resize(A.rows(), keep);

    // Flip to descending; drop pairs below the threshold to zero
    for (Index i = 0; i < keep; ++i) {
        const Index src = size - 1 - i;
        const double value = ascending.eigenvalues(src);
        if (value < thresh) {
            result.eigenvalues(i) = 0.0;
            result.eigenvectors.col(i).setZero();
        } else {
            result.eigenvalues(i) = value;
            result.eigenvectors.col(i) = ascending.eigenvectors.col(src);
        }
    }
    return result;
}

// =============================================================================
// Pseudoinverse
// =============================================================================

Matrix pinv(const Matrix& M, double rcond) {
    if (M.rows() == 0 || M.cols() == 0) {
        return Matrix::Zero(M.cols(), M.rows());
    }

    Eigen::BDCSVD<Matrix> svd(M, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Vector& s = svd.singularValues();
    const double cutoff = rcond * s(0);

    Vector s_inv = Vector::Zero(s.size());
    for (Index i = 0; i < s.size(); ++i) {
        if (s(i) > cutoff) {
            s_inv(i) = 1.0 / s(i);
        }
    }

    return svd.matrixV() * s_inv.asDiagonal() * svd.matrixU().transpose();
}

// =============================================================================
// Slicing
// =============================================================================

Matrix take_columns(const Matrix& M, const Indices& idx) {
    Matrix out(M.rows(), static_cast<Index>(idx.size()));
    for (size_t i = 0; i < idx.size(); ++i) {
        CURDECOMP_CHECK_ARGUMENT(idx[i] >= 0 && idx[i] < M.cols(),
            "Column index " + std::to_string(idx[i]) + " out of range");
        out.col(static_cast<Index>(i)) = M.col(idx[i]);
    }
    return out;
}

Matrix take_rows(const Matrix& M, const Indices& idx) {
    Matrix out(static_cast<Index>(idx.size()), M.cols());
    for (size_t i = 0; i < idx.size(); ++i) {
        CURDECOMP_CHECK_ARGUMENT(idx[i] >= 0 && idx[i] < M.rows(),
            "Row index " + std::to_string(idx[i]) + " out of range");
        out.row(static_cast<Index>(i)) = M.row(idx[i]);
    }
    return out;
}

} // namespace la
} // namespace curdecomp
