#pragma once

/**
 * PCovR modified covariance
 *
 * C = alpha * X^T X + (1 - alpha) * C_lr
 *
 * where C_lr = (C^{1/2} C^+ X^T Y)(C^{1/2} C^+ X^T Y)^T is the covariance of
 * the linear-regression approximation of Y, expressed on the same scale as
 * the PCA covariance. C^{1/2} and C^+ are built only from eigenpairs of
 * X^T X above the regularization floor.
 *
 * References:
 * - S. de Jong, H. A. L. Kiers, Chemom. Intell. Lab. Syst. 14, 155 (1992)
 * - G. Imbalzano et al., J. Chem. Phys. 148, 241730 (2018)
 */

#include "curdecomp/types.hpp"

namespace curdecomp {

constexpr double kDefaultRegularization = 1e-6;

/**
 * Build the PCovR covariance of features X (columns) against properties Y.
 *
 * @param X               n_samples x n_features
 * @param Y               n_samples x n_properties
 * @param alpha           mixing weight in [0, 1]; 1 is pure PCA
 * @param regularization  eigenvalues of X^T X not above this are discarded
 * @return n_features x n_features symmetric matrix
 *
 * @throws ConfigurationError  alpha outside [0, 1] or row counts differ
 * @throws RankDeficiencyError no eigenvalue of X^T X above the floor
 */
Matrix pcovr_covariance(const Matrix& X, const Matrix& Y, double alpha,
                        double regularization = kDefaultRegularization);

} // namespace curdecomp
