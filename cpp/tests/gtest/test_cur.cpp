// =============================================================================
// CUR Orchestrator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "curdecomp/cur.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/logging.hpp"
#include "curdecomp/strategy_registry.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <random>
#include <set>
#include <sstream>
#include <utility>

using namespace curdecomp;

namespace {

// Picks columns left to right, continuing any resume list
class LeftToRightSelection : public SelectionStrategy {
public:
    std::string name() const override { return "left-to-right"; }

    SelectionResult select(const Matrix& matrix, Index count, const Indices& resume,
                           const SelectionParams&) const override {
        SelectionResult result;
        result.requested = count;
        result.indices = resume;
        for (Index j = static_cast<Index>(resume.size());
             j < std::min(count, matrix.cols()); ++j) {
            result.indices.push_back(j);
        }
        result.exhausted = count > matrix.cols();
        return result;
    }
};

// Returns `initial` for a fresh selection and `extended` when resuming
class ScriptedSelection : public SelectionStrategy {
public:
    ScriptedSelection(Indices initial, Indices extended = {})
        : initial_(std::move(initial)), extended_(std::move(extended)) {}

    std::string name() const override { return "scripted"; }

    SelectionResult select(const Matrix&, Index count, const Indices& resume,
                           const SelectionParams&) const override {
        SelectionResult result;
        result.requested = count;
        result.indices = resume.empty() ? initial_ : extended_;
        return result;
    }

private:
    Indices initial_;
    Indices extended_;
};

} // namespace

class CurTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
    }

    std::mt19937 rng;

    Matrix random_matrix(Index rows, Index cols, double scale = 1.0) {
        std::normal_distribution<double> dist(0.0, scale);
        Matrix M(rows, cols);
        for (Index i = 0; i < rows; ++i)
            for (Index j = 0; j < cols; ++j)
                M(i, j) = dist(rng);
        return M;
    }

    Matrix symmetric_matrix(Index n) {
        Matrix N = random_matrix(n, n, 0.01);
        return Matrix::Identity(n, n) + 0.5 * (N + N.transpose());
    }

    static bool distinct(const Indices& idx) {
        return std::set<Index>(idx.begin(), idx.end()).size() == idx.size();
    }
};

// =============================================================================
// Mode detection
// =============================================================================

TEST_F(CurTest, DetectsSymmetry) {
    EXPECT_TRUE(CUR(symmetric_matrix(4)).symmetric());
    EXPECT_FALSE(CUR(random_matrix(4, 4)).symmetric());
    EXPECT_FALSE(CUR(random_matrix(4, 3)).symmetric());
}

TEST_F(CurTest, SymmetryUsesTolerance) {
    Matrix A = symmetric_matrix(4);
    A(0, 3) += 1e-3;

    EXPECT_FALSE(CUR::is_symmetric(A, kDefaultSymmetryTolerance));
    EXPECT_TRUE(CUR::is_symmetric(A, 1e-2));

    CurOptions options;
    options.symmetry_tolerance = 1e-2;
    EXPECT_TRUE(CUR(A, options).symmetric());
}

TEST_F(CurTest, RejectsBadMatrices) {
    EXPECT_THROW(CUR{Matrix(0, 3)}, InvalidArgumentError);

    Matrix A = random_matrix(3, 3);
    A(1, 2) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(CUR{A}, InvalidArgumentError);
}

// =============================================================================
// Symmetric
// =============================================================================

TEST_F(CurTest, SymmetricRowsMirrorColumns) {
    CUR cur(symmetric_matrix(4));
    Decomposition d = cur.compute(2);

    ASSERT_EQ(d.idx_c.size(), 2u);
    EXPECT_TRUE(distinct(d.idx_c));
    EXPECT_EQ(d.idx_r, d.idx_c);
    EXPECT_LT((d.A_r - d.A_c.transpose()).norm(), 1e-15);
    EXPECT_TRUE(d.complete);
}

TEST_F(CurTest, SymmetricLossDecreases) {
    CUR cur(symmetric_matrix(4));
    const double l1 = cur.loss(1);
    const double l2 = cur.loss(2);

    EXPECT_LT(l2, l1);
    EXPECT_LT(cur.loss(4), 1e-10);
}

TEST_F(CurTest, SymmetricIgnoresRowCount) {
    CUR cur(symmetric_matrix(5));
    Decomposition d = cur.compute(2, 4);

    EXPECT_EQ(d.idx_r.size(), 2u);
    EXPECT_EQ(d.idx_r, d.idx_c);
}

// =============================================================================
// General
// =============================================================================

TEST_F(CurTest, NonSymmetricNeedsRowCount) {
    CUR cur(random_matrix(6, 5));
    EXPECT_THROW(cur.compute(2), UsageError);
    EXPECT_THROW(cur.loss(2), UsageError);
}

TEST_F(CurTest, CountsBelowOneAreRejected) {
    CUR cur(random_matrix(6, 5));
    EXPECT_THROW(cur.compute(0, 2), UsageError);
    EXPECT_THROW(cur.compute(2, 0), UsageError);
}

TEST_F(CurTest, LossIsMonotone) {
    CUR cur(random_matrix(8, 6));

    double previous = cur.loss(1, 1);
    for (Index n = 2; n <= 6; ++n) {
        const double current = cur.loss(n, n);
        EXPECT_LE(current, previous + 1e-12) << "n = " << n;
        previous = current;
    }
}

TEST_F(CurTest, FullRankRoundTrip) {
    CUR cur(random_matrix(5, 5));
    EXPECT_LT(cur.loss(5, 5), 1e-10);
}

TEST_F(CurTest, SmallScaleFullRankRoundTrip) {
    CUR symmetric(1e-4 * symmetric_matrix(4));
    Decomposition d = symmetric.compute(4);

    EXPECT_EQ(d.idx_c.size(), 4u);
    EXPECT_TRUE(d.complete);
    EXPECT_LT(symmetric.loss(4), 1e-10);
    EXPECT_LT(symmetric.loss(2), symmetric.loss(1));

    CUR general(5e-4 * random_matrix(6, 5));
    Decomposition g = general.compute(3, 3);
    EXPECT_EQ(g.idx_c.size(), 3u);
    EXPECT_EQ(g.idx_r.size(), 3u);
    EXPECT_LT(general.loss(5, 5), 1e-10);
}

TEST_F(CurTest, SmallScaleProjector) {
    CUR cur(1e-4 * Matrix::Identity(4, 4));
    const Matrix& P = cur.compute_P(2);

    EXPECT_EQ(P.rows(), 2);
    EXPECT_EQ(P.cols(), 2);
    EXPECT_TRUE(P.allFinite());
    EXPECT_GT(P.norm(), 0.0);
}

TEST_F(CurTest, ZeroMatrixIsRankDeficient) {
    CUR symmetric(Matrix::Zero(4, 4));
    EXPECT_THROW(symmetric.compute_P(2), RankDeficiencyError);
    EXPECT_THROW(symmetric.loss(2), RankDeficiencyError);
    EXPECT_FALSE(symmetric.projector().has_value());

    CUR general(Matrix::Zero(4, 3));
    EXPECT_THROW(general.compute(2, 2), RankDeficiencyError);

    CurOptions options;
    options.feature_select = true;
    options.pi_function = "pcovr";
    options.params.properties = random_matrix(5, 1);
    options.params.alpha = 0.5;
    CUR pcovr(Matrix::Zero(5, 3), options);
    EXPECT_THROW(pcovr.loss(1), RankDeficiencyError);
}

TEST_F(CurTest, RowsAndColumnsAreDistinct) {
    CUR cur(random_matrix(9, 7));
    Decomposition d = cur.compute(5, 6);

    EXPECT_EQ(d.idx_c.size(), 5u);
    EXPECT_EQ(d.idx_r.size(), 6u);
    EXPECT_TRUE(distinct(d.idx_c));
    EXPECT_TRUE(distinct(d.idx_r));
    EXPECT_EQ(d.A_c.cols(), 5);
    EXPECT_EQ(d.A_r.rows(), 6);
    EXPECT_EQ(d.S.rows(), 5);
    EXPECT_EQ(d.S.cols(), 6);
}

TEST_F(CurTest, CacheExtendsAndSlices) {
    const Matrix A = random_matrix(8, 6);
    CUR incremental(A);
    CUR direct(A);

    incremental.compute(2, 2);
    Decomposition grown = incremental.compute(4, 3);
    Decomposition single = direct.compute(4, 3);

    EXPECT_EQ(grown.idx_c, single.idx_c);
    EXPECT_EQ(grown.idx_r, single.idx_r);

    Decomposition small = incremental.compute(1, 1);
    EXPECT_EQ(incremental.idx_c().size(), 4u);
    ASSERT_EQ(small.idx_c.size(), 1u);
    EXPECT_EQ(small.idx_c[0], grown.idx_c[0]);
    EXPECT_EQ(small.idx_r[0], grown.idx_r[0]);
}

TEST_F(CurTest, PrecomputeFillsCache) {
    CurOptions options;
    options.precompute = CurOptions::precompute_count(3);
    CUR cur(random_matrix(7, 5), options);

    EXPECT_EQ(cur.idx_c().size(), 3u);
    EXPECT_EQ(cur.idx_r().size(), 3u);
}

TEST_F(CurTest, ComputeIdxReportsSelection) {
    CUR cur(random_matrix(6, 4));
    IndexSelection selection = cur.compute_idx(3, 2);

    EXPECT_EQ(selection.idx_c.size(), 3u);
    EXPECT_EQ(selection.idx_r.size(), 2u);
    EXPECT_TRUE(selection.columns_complete);
    EXPECT_TRUE(selection.rows_complete);
}

// =============================================================================
// Feature selection
// =============================================================================

TEST_F(CurTest, FeatureSelectKeepsAllRows) {
    const Matrix A = random_matrix(7, 5);
    CurOptions options;
    options.feature_select = true;
    CUR cur(A, options);

    Decomposition d = cur.compute(2);
    Indices all(5);
    std::iota(all.begin(), all.end(), Index{0});

    EXPECT_EQ(d.idx_c.size(), 2u);
    EXPECT_EQ(d.idx_r, all);
    EXPECT_EQ((d.A_r - A).norm(), 0.0);
    EXPECT_TRUE(cur.feature_select());
}

TEST_F(CurTest, FeatureSelectWinsOverSymmetry) {
    CurOptions options;
    options.feature_select = true;
    CUR cur(symmetric_matrix(4), options);

    Decomposition d = cur.compute(2);
    EXPECT_EQ(d.idx_r.size(), 4u);
    EXPECT_EQ(d.A_r.rows(), 4);
}

TEST_F(CurTest, FeatureSelectLossMatchesColumnProjection) {
    const Matrix A = random_matrix(7, 5);
    CurOptions options;
    options.feature_select = true;
    CUR cur(A, options);

    Decomposition d = cur.compute(3);
    const double expected = relative_error(A, approximate(A, d.idx_c));
    EXPECT_NEAR(cur.loss(3), expected, 1e-10);
}

// =============================================================================
// PCovR
// =============================================================================

TEST_F(CurTest, PcovrNeedsProperties) {
    CurOptions options;
    options.pi_function = "pcovr";
    EXPECT_THROW(CUR(symmetric_matrix(4), options), ConfigurationError);
}

TEST_F(CurTest, PcovrRowsNeedOwnProperties) {
    const Matrix A = random_matrix(8, 6);
    CurOptions options;
    options.pi_function = "pcovr";
    options.params.properties = random_matrix(8, 2);
    options.params.alpha = 0.5;
    EXPECT_THROW(CUR(A, options), ConfigurationError);

    SelectionParams rows;
    rows.properties = random_matrix(6, 2);
    rows.alpha = 0.5;
    options.row_params = rows;
    CUR cur(A, options);

    Decomposition d = cur.compute(3, 3);
    EXPECT_EQ(d.idx_c.size(), 3u);
    EXPECT_EQ(d.idx_r.size(), 3u);
    EXPECT_TRUE(distinct(d.idx_c));
    EXPECT_TRUE(distinct(d.idx_r));
}

TEST_F(CurTest, PcovrExhaustionGivesPartialDecomposition) {
    const Matrix A = random_matrix(8, 2) * random_matrix(2, 6);
    CurOptions options;
    options.feature_select = true;
    options.pi_function = "pcovr";
    options.params.properties = random_matrix(8, 2);
    options.params.alpha = 0.5;
    CUR cur(A, options);

    std::ostringstream captured;
    set_log_output(captured);
    Decomposition d = cur.compute(4);
    set_log_output(std::cerr);

    EXPECT_EQ(d.idx_c.size(), 2u);
    EXPECT_FALSE(d.complete);
    EXPECT_NE(captured.str().find("WARN"), std::string::npos);

    // Rank 2 is captured exactly by two columns
    EXPECT_LT(cur.loss(2), 1e-8);
    EXPECT_NO_THROW(cur.loss(5));
    EXPECT_EQ(cur.idx_c().size(), 2u);
}

// =============================================================================
// Strategies and projector
// =============================================================================

TEST_F(CurTest, CustomStrategyInstance) {
    CurOptions options;
    options.strategy = std::make_shared<LeftToRightSelection>();
    CUR cur(random_matrix(6, 5), options);

    Decomposition d = cur.compute(3, 2);
    EXPECT_EQ(d.idx_c, (Indices{0, 1, 2}));
    EXPECT_EQ(d.idx_r, (Indices{0, 1}));
    EXPECT_EQ(cur.strategy().name(), "left-to-right");
}

TEST_F(CurTest, CustomStrategyByName) {
    StrategyRegistry::instance().register_type<LeftToRightSelection>("left-to-right");

    CurOptions options;
    options.pi_function = "left-to-right";
    CUR cur(symmetric_matrix(4), options);

    EXPECT_EQ(cur.compute(2).idx_c, (Indices{0, 1}));
}

TEST_F(CurTest, StrategyDuplicatesAreRejected) {
    CurOptions options;
    options.strategy = std::make_shared<ScriptedSelection>(Indices{0, 0, 0});
    CUR cur(Matrix::Identity(4, 4), options);

    EXPECT_THROW(cur.compute(3), ConfigurationError);
    EXPECT_TRUE(cur.idx_c().empty());
}

TEST_F(CurTest, StrategyIndexOutOfRangeIsRejected) {
    CurOptions options;
    options.strategy = std::make_shared<ScriptedSelection>(Indices{0, 7});
    CUR cur(Matrix::Identity(4, 4), options);

    EXPECT_THROW(cur.compute(2), ConfigurationError);
}

TEST_F(CurTest, StrategyMustKeepCachedPrefix) {
    CurOptions options;
    options.strategy = std::make_shared<ScriptedSelection>(Indices{0, 1}, Indices{1, 0, 2});
    CUR cur(Matrix::Identity(4, 4), options);

    EXPECT_EQ(cur.compute(2).idx_c, (Indices{0, 1}));
    EXPECT_THROW(cur.compute(3), ConfigurationError);
    EXPECT_EQ(cur.idx_c(), (Indices{0, 1}));
}

TEST_F(CurTest, UnknownStrategyName) {
    CurOptions options;
    options.pi_function = "nonexistent";
    EXPECT_THROW(CUR(random_matrix(3, 3), options), ConfigurationError);
}

TEST_F(CurTest, ComputePStoresProjector) {
    CUR cur(symmetric_matrix(5));
    EXPECT_FALSE(cur.projector().has_value());

    const Matrix& P = cur.compute_P(3);
    ASSERT_TRUE(cur.projector().has_value());
    EXPECT_EQ(P.rows(), 3);
    EXPECT_EQ(P.cols(), 3);

    Decomposition d = cur.compute(3);
    const Matrix SA = d.S * d.A_r;
    EXPECT_LT((P * P.transpose() - SA * SA.transpose()).norm(), 1e-8 * SA.squaredNorm());
}

TEST_F(CurTest, ComputePOverwrites) {
    CUR cur(random_matrix(6, 5));
    cur.compute_P(2, 2);
    cur.compute_P(4, 3);
    EXPECT_EQ(cur.projector()->rows(), 4);
}
