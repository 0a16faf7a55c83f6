#include "curdecomp/selection.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/helpers/deflation.hpp"
#include "curdecomp/linear_algebra.hpp"
#include "curdecomp/logging.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace curdecomp {

namespace {

void check_resume(const Matrix& matrix, const Indices& resume) {
    std::vector<bool> seen(static_cast<size_t>(matrix.cols()), false);
    for (Index j : resume) {
        CURDECOMP_CHECK_ARGUMENT(j >= 0 && j < matrix.cols(),
            "Resume index " + std::to_string(j) + " out of range [0, " +
            std::to_string(matrix.cols()) + ")");
        CURDECOMP_CHECK_ARGUMENT(!seen[static_cast<size_t>(j)],
            "Resume list contains index " + std::to_string(j) + " twice");
        seen[static_cast<size_t>(j)] = true;
    }
}

// Never more indices than candidate columns
Index selection_target(const Matrix& matrix, Index count) {
    return std::min(count, matrix.cols());
}

// Absolute exhaustion floor: regularization relative to sigma_max(matrix)^2
double exhaustion_floor(const Matrix& matrix, double regularization) {
    const double top = la::truncated_svd(matrix, 1).singular_values(0);
    return regularization * top * top;
}

} // namespace

// =============================================================================
// Shared pieces
// =============================================================================

void SelectionStrategy::validate(const Matrix&, const SelectionParams& params) const {
    CURDECOMP_CHECK_CONFIG(params.rank >= 1,
        "Selection rank must be at least 1, got " + std::to_string(params.rank), "");
}

Index select_best_index(const Vector& scores, const Indices& excluded) {
    std::vector<bool> skip(static_cast<size_t>(scores.size()), false);
    for (Index j : excluded) {
        if (j >= 0 && j < scores.size()) skip[static_cast<size_t>(j)] = true;
    }

    Index best = -1;
    double best_score = 0.0;
    for (Index j = 0; j < scores.size(); ++j) {
        if (skip[static_cast<size_t>(j)]) continue;
        // Strict comparison keeps the first (lowest) index among equal maxima
        if (scores(j) > best_score) {
            best_score = scores(j);
            best = j;
        }
    }
    return best;
}

Matrix update_properties(const Matrix& Y, const Matrix& X_c) {
    CURDECOMP_CHECK_ARGUMENT(Y.rows() == X_c.rows(),
        "Property matrix and selected columns disagree on sample count");
    if (X_c.cols() == 0) {
        return Y;
    }
    const Matrix gram_inv = la::pinv(X_c.transpose() * X_c);
    return Y - X_c * (gram_inv * (X_c.transpose() * Y));
}

// =============================================================================
// SVD leverage
// =============================================================================

SelectionResult SvdLeverageSelection::select(const Matrix& matrix, Index count,
                                             const Indices& resume,
                                             const SelectionParams& params) const {
    validate(matrix, params);
    check_resume(matrix, resume);

    SelectionResult result;
    result.requested = count;
    result.indices = resume;

    const Index target = selection_target(matrix, count);
    if (static_cast<Index>(resume.size()) >= target) {
        result.exhausted = static_cast<Index>(resume.size()) < count;
        return result;
    }

    const double energy_floor = exhaustion_floor(matrix, params.regularization);
    Matrix work = matrix;
    for (Index j : resume) {
        helpers::deflate_column(work, j);
    }

    while (static_cast<Index>(result.indices.size()) < target) {
        const la::SvdResult svd = la::truncated_svd(work, params.rank);
        const double top = svd.singular_values(0);
        if (top * top <= energy_floor) {
            LOG_INFO("Working matrix exhausted after ", result.indices.size(),
                     " columns (largest singular value ", top, ")");
            result.exhausted = true;
            return result;
        }

        const Vector scores = svd.V.array().square().rowwise().sum();
        const Index best = select_best_index(scores, result.indices);
        if (best < 0) {
            LOG_INFO("No unselected column carries leverage after ", result.indices.size(), " columns");
            result.exhausted = true;
            return result;
        }

        LOG_DEBUG("svd: selected column ", best, " (score ", scores(best), ")");
        result.indices.push_back(best);
        helpers::deflate_column(work, best);
    }

    result.exhausted = target < count;
    return result;
}

// =============================================================================
// PCovR
// =============================================================================

void PcovrSelection::validate(const Matrix& matrix, const SelectionParams& params) const {
    SelectionStrategy::validate(matrix, params);
    CURDECOMP_CHECK_CONFIG(params.properties.has_value() && params.alpha.has_value(),
        "PCovR selection needs both a property matrix Y and a mixing weight alpha",
        "Set SelectionParams::properties and SelectionParams::alpha");
    CURDECOMP_CHECK_CONFIG(*params.alpha >= 0.0 && *params.alpha <= 1.0,
        "PCovR mixing weight alpha must lie in [0, 1], got " + std::to_string(*params.alpha), "");
    CURDECOMP_CHECK_CONFIG(params.properties->rows() == matrix.rows(),
        "Property matrix has " + std::to_string(params.properties->rows()) +
        " rows, expected " + std::to_string(matrix.rows()),
        "Row selection on a non-symmetric matrix needs its own row_params with n_cols rows");
}

SelectionResult PcovrSelection::select(const Matrix& matrix, Index count,
                                       const Indices& resume,
                                       const SelectionParams& params) const {
    validate(matrix, params);
    check_resume(matrix, resume);

    SelectionResult result;
    result.requested = count;
    result.indices = resume;

    const Index target = selection_target(matrix, count);
    if (static_cast<Index>(resume.size()) >= target) {
        result.exhausted = static_cast<Index>(resume.size()) < count;
        return result;
    }

    const double alpha = *params.alpha;
    const double energy_floor = exhaustion_floor(matrix, params.regularization);
    Matrix work = matrix;
    for (Index j : resume) {
        helpers::deflate_column(work, j);
    }
    Matrix y = update_properties(*params.properties, la::take_columns(matrix, result.indices));

    while (static_cast<Index>(result.indices.size()) < target) {
        Matrix Ct;
        try {
            Ct = pcovr_covariance(work, y, alpha, energy_floor);
        } catch (const RankDeficiencyError& e) {
            LOG_INFO("Only ", result.indices.size(), " features possible: ", e.what());
            result.exhausted = true;
            return result;
        }

        const la::EigResult eig = la::sorted_eig(Ct, 0.0, params.rank);
        const Vector scores = eig.eigenvectors.array().square().rowwise().sum();
        const Index best = select_best_index(scores, result.indices);
        if (best < 0) {
            LOG_INFO("No unselected column carries PCovR weight after ", result.indices.size(), " columns");
            result.exhausted = true;
            return result;
        }

        LOG_DEBUG("pcovr: selected column ", best, " (score ", scores(best), ")");
        result.indices.push_back(best);
        helpers::deflate_column(work, best);
        y = update_properties(y, la::take_columns(matrix, result.indices));
    }

    result.exhausted = target < count;
    return result;
}

} // namespace curdecomp
