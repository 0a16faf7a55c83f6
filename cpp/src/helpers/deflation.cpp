#include "curdecomp/helpers/deflation.hpp"
#include "curdecomp/error.hpp"

#include <cmath>
#include <string>

namespace curdecomp {
namespace helpers {

void deflate_column(Matrix& M, Index j) {
    CURDECOMP_CHECK_ARGUMENT(j >= 0 && j < M.cols(),
        "Deflation column " + std::to_string(j) + " out of range [0, " +
        std::to_string(M.cols()) + ")");

    const double norm = M.col(j).norm();
    if (norm == 0.0 || !std::isfinite(norm)) {
        throw NumericalSingularityError(
            "Column " + std::to_string(j) + " has zero norm in the working matrix",
            __func__,
            "The column is already spanned by previously selected columns");
    }

    const Vector v = M.col(j) / norm;
    const Eigen::RowVectorXd coeffs = v.transpose() * M;
    M.noalias() -= v * coeffs;
}

} // namespace helpers
} // namespace curdecomp
