#include "curdecomp/covariance.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/linear_algebra.hpp"

#include <string>

namespace curdecomp {

Matrix pcovr_covariance(const Matrix& X, const Matrix& Y, double alpha,
                        double regularization) {
    CURDECOMP_CHECK_CONFIG(alpha >= 0.0 && alpha <= 1.0,
        "PCovR mixing weight alpha must lie in [0, 1], got " + std::to_string(alpha),
        "Use alpha = 1 for pure PCA and alpha = 0 for pure regression");
    CURDECOMP_CHECK_CONFIG(X.rows() == Y.rows(),
        "Property matrix has " + std::to_string(Y.rows()) + " rows but the feature matrix has " +
        std::to_string(X.rows()),
        "Y must hold one row per sample of the matrix being selected");

    const Matrix cov = X.transpose() * X;
    const la::EigResult eig = la::sorted_eig(cov, regularization);

    // Descending order: survivors form a prefix
    Index rank = 0;
    while (rank < eig.eigenvalues.size() && eig.eigenvalues(rank) > regularization) {
        ++rank;
    }
    if (rank == 0) {
        throw RankDeficiencyError(
            "No eigenvalue of X^T X above regularization " + std::to_string(regularization),
            __func__);
    }

    const Matrix U = eig.eigenvectors.leftCols(rank);
    const Vector v = eig.eigenvalues.head(rank);

    const Matrix Csqrt = U * v.cwiseSqrt().asDiagonal() * U.transpose();
    const Matrix Cinv = U * v.cwiseInverse().asDiagonal() * U.transpose();

    const Matrix lr = Csqrt * (Cinv * (X.transpose() * Y));
    const Matrix C_lr = lr * lr.transpose();

    return alpha * cov + (1.0 - alpha) * C_lr;
}

} // namespace curdecomp
