#include "curdecomp/approximation.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/linear_algebra.hpp"

namespace curdecomp {

Matrix middle_matrix(const Matrix& A, const Matrix& A_c, const Matrix& A_r) {
    CURDECOMP_CHECK_ARGUMENT(A_c.rows() == A.rows(),
        "Column factor must have the row count of A");
    CURDECOMP_CHECK_ARGUMENT(A_r.cols() == A.cols(),
        "Row factor must have the column count of A");
    return la::pinv(A_c) * A * la::pinv(A_r);
}

Matrix approximate(const Matrix& A, const Indices& idx_c, const std::optional<Indices>& idx_r) {
    const Matrix A_c = la::take_columns(A, idx_c);
    if (!idx_r) {
        return A_c * (la::pinv(A_c) * A);
    }
    const Matrix A_r = la::take_rows(A, *idx_r);
    return A_c * (middle_matrix(A, A_c, A_r) * A_r);
}

Matrix compute_projector(const Matrix& A_c, const Matrix& S, const Matrix& A_r, double thresh) {
    CURDECOMP_CHECK_ARGUMENT(S.rows() == A_c.cols() && S.cols() == A_r.rows(),
        "Middle matrix does not match the column and row factors");
    CURDECOMP_CHECK_ARGUMENT(S.rows() > 0 && S.cols() > 0,
        "Projector needs at least one selected column and row");

    const Matrix SA = S * A_r;
    la::EigResult eig = la::symmetric_eig(SA * SA.transpose());

    for (Index i = 0; i < eig.eigenvalues.size(); ++i) {
        if (eig.eigenvalues(i) < thresh) eig.eigenvalues(i) = 0.0;
    }

    return eig.eigenvectors * eig.eigenvalues.cwiseSqrt().asDiagonal();
}

double relative_error(const Matrix& A, const Matrix& approx) {
    CURDECOMP_CHECK_ARGUMENT(A.rows() == approx.rows() && A.cols() == approx.cols(),
        "Approximation shape differs from the matrix");
    const double norm = A.norm();
    if (norm == 0.0) {
        throw NumericalError("Relative error of a zero matrix is undefined", __func__);
    }
    return (A - approx).norm() / norm;
}

} // namespace curdecomp
