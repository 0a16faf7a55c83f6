// =============================================================================
// PCovR Covariance Tests
// =============================================================================

#include <gtest/gtest.h>
#include "curdecomp/covariance.hpp"
#include "curdecomp/error.hpp"

#include <Eigen/Eigenvalues>
#include <random>

using namespace curdecomp;

class CovarianceTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
        X = random_matrix(8, 4);
        Y = random_matrix(8, 2);
    }

    std::mt19937 rng;
    Matrix X;
    Matrix Y;

    Matrix random_matrix(Index rows, Index cols) {
        std::normal_distribution<double> dist(0.0, 1.0);
        Matrix M(rows, cols);
        for (Index i = 0; i < rows; ++i)
            for (Index j = 0; j < cols; ++j)
                M(i, j) = dist(rng);
        return M;
    }
};

TEST_F(CovarianceTest, AlphaOneIsFeatureCovariance) {
    Matrix C = pcovr_covariance(X, Y, 1.0);
    EXPECT_LT((C - X.transpose() * X).norm(), 1e-10);
}

TEST_F(CovarianceTest, AlphaZeroIsRegressionCovariance) {
    Matrix C = pcovr_covariance(X, Y, 0.0);

    // Full-rank X: Csqrt * Cinv = (X^T X)^{-1/2}
    Eigen::SelfAdjointEigenSolver<Matrix> es(X.transpose() * X);
    const Matrix isqrt = es.operatorInverseSqrt();
    const Matrix lr = isqrt * X.transpose() * Y;
    const Matrix expected = lr * lr.transpose();

    EXPECT_LT((C - expected).norm(), 1e-8 * expected.norm());
}

TEST_F(CovarianceTest, ResultIsSymmetricPositiveSemidefinite) {
    Matrix C = pcovr_covariance(X, Y, 0.3);

    EXPECT_LT((C - C.transpose()).norm(), 1e-10 * C.norm());
    Eigen::SelfAdjointEigenSolver<Matrix> es(C);
    EXPECT_GT(es.eigenvalues().minCoeff(), -1e-10 * C.norm());
}

TEST_F(CovarianceTest, LinearInAlpha) {
    Matrix C0 = pcovr_covariance(X, Y, 0.0);
    Matrix C1 = pcovr_covariance(X, Y, 1.0);
    Matrix Ch = pcovr_covariance(X, Y, 0.25);

    EXPECT_LT((Ch - (0.25 * C1 + 0.75 * C0)).norm(), 1e-10 * C1.norm());
}

TEST_F(CovarianceTest, ZeroFeaturesAreRankDeficient) {
    Matrix Z = Matrix::Zero(8, 3);
    EXPECT_THROW(pcovr_covariance(Z, Y, 0.5), RankDeficiencyError);
}

TEST_F(CovarianceTest, BelowRegularizationIsRankDeficient) {
    Matrix tiny = 1e-5 * random_matrix(8, 3);
    // All eigenvalues of tiny^T tiny are O(1e-9)
    EXPECT_THROW(pcovr_covariance(tiny, Y, 0.5), RankDeficiencyError);
    EXPECT_NO_THROW(pcovr_covariance(tiny, Y, 0.5, 1e-14));
}

TEST_F(CovarianceTest, RejectsAlphaOutsideUnitInterval) {
    EXPECT_THROW(pcovr_covariance(X, Y, -0.1), ConfigurationError);
    EXPECT_THROW(pcovr_covariance(X, Y, 1.5), ConfigurationError);
}

TEST_F(CovarianceTest, RejectsMismatchedProperties) {
    Matrix bad = random_matrix(5, 2);
    EXPECT_THROW(pcovr_covariance(X, bad, 0.5), ConfigurationError);
}
